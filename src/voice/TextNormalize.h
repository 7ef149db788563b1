#pragma once

#include <string>
#include <vector>

namespace text
{

// Lowercases ASCII and Cyrillic letters in UTF-8 text and folds "ё" into "е".
std::string toLowerUtf8(const std::string &input);

// Lowercases, replaces punctuation with spaces and splits on whitespace. '%' and digits are kept.
std::vector<std::string> tokenize(const std::string &input);

bool startsWith(const std::string &value, const std::string &prefix);

} // namespace text
