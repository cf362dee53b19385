#include <util.hpp>
#include <cstdio>
#include <cerrno>
// definitions for util functions


bool mkdirR(std::string filename) { // recursively create the directories before a file
    // expects syntax like directory/directory/file. a bare filename has nothing to create.
    struct stat sb;
    size_t blobend = 1; // a leading / is the root, not a directory to make
    while (blobend < filename.size()) {
        if (filename[blobend] == '/') {
            std::string dirname = filename.substr(0, blobend);
            if (stat(dirname.c_str(), &sb) == -1) {
                if (mkdir(dirname.c_str(), 0755) != 0 && errno != EEXIST) { // EEXIST: somebody else got there first
                    printf(ERROR "Couldn't create %s!\n", dirname.c_str());
                    perror("\tmkdir");
                    return false;
                }
            }
            else if (!S_ISDIR(sb.st_mode)) {
                printf(ERROR "%s exists and is not a directory. Aborting recursive mkdir operation.\n", dirname.c_str());
                return false;
            }
        }
        blobend++;
    }
    return true;
}


bool isNumber(const char* data) {
    size_t s = strlen(data);
    if (s == 0) {
        return false;
    }
    bool digits = false;
    bool dot = false;
    for (size_t i = 0; i < s; i ++) {
        if (data[i] >= '0' && data[i] <= '9') {
            digits = true;
        }
        else if (data[i] == '-' && i == 0) {
            continue;
        }
        else if (data[i] == '.' && !dot) {
            dot = true;
        }
        else {
            return false;
        }
    }
    return digits;
}

bool isWhitespace(char thing) {
    return thing == ' ' || thing == '\t' || thing == '\n' || thing == '\r';
}

bool isBlank(const std::string& thing) {
    for (char c : thing) {
        if (!isWhitespace(c)) {
            return false;
        }
    }
    return true;
}
