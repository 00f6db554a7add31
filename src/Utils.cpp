#include "Utils.hpp"
#include <cctype>
#include <sstream>

std::string trim(const std::string &str) {
    size_t begin = 0;
    size_t end = str.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(str[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) end--;
    return str.substr(begin, end - begin);
}

std::vector<std::string> split(const std::string &str, char delim) {
    std::vector<std::string> tokens;
    std::istringstream stream(str);
    std::string token;
    while (std::getline(stream, token, delim)) {
        token = trim(token);
        if (!token.empty())
            tokens.push_back(token);
    }
    return tokens;
}

bool isDigits(const std::string &str) {
    if (str.empty()) return false;
    for (char c : str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string toLower(const std::string &str) {
    std::string lower(str);
    for (char &c : lower)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return lower;
}
