#pragma once
#include <string>
#include <cstring>
#include <cstdint>
#include <sys/stat.h>
#include <defs.h>

bool mkdirR(std::string filename); // create every directory in front of a file. returns false if one couldn't be made

bool isNumber(const char* data); // decimal number: optional leading -, digits, at most one .

bool isWhitespace(char thing);

bool isBlank(const std::string& thing); // empty or nothing but whitespace
