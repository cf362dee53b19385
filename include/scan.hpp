// Static deny-list scan for pattern scripts.
// This is a cheap first filter run before anything is stored or executed. It is NOT the safety boundary; the guard and the
// restricted sandbox environment are. Obfuscated access can get past it, and that's fine.
#pragma once
#include <string>
#include <vector>
#include <defs.h>


const char* deniedToken(const std::string& script); // returns the first forbidden identifier in script, or NULL if it's clean
// an identifier only counts when it's used bare: `context.process` and `chart:require()` are property accesses and pass.

const std::vector<const char*>& denyList();

bool isIdentifierChar(char c);
