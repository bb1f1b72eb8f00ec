//
// Created by fieldrel on 10/17/26.
//

#include "StringUtil.hpp"

namespace fieldrel::utility {
    namespace {
        bool isSpace(char c) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }
        
        bool isUpper(char c) {
            return c >= 'A' && c <= 'Z';
        }
        
        bool isLower(char c) {
            return c >= 'a' && c <= 'z';
        }
        
        bool isDigit(char c) {
            return c >= '0' && c <= '9';
        }
        
        char lowerChar(char c) {
            return isUpper(c) ? static_cast<char>(c - 'A' + 'a') : c;
        }
    }
    
    std::string trim(const std::string &source) {
        size_t begin = 0;
        size_t end = source.size();
        
        while (begin < end && isSpace(source[begin])) {
            begin++;
        }
        
        while (end > begin && isSpace(source[end - 1])) {
            end--;
        }
        
        return source.substr(begin, end - begin);
    }
    
    std::string toLower(const std::string &source) {
        std::string result(source);
        
        for (auto &c: result) {
            c = lowerChar(c);
        }
        
        return result;
    }
    
    std::string normalizeValue(const std::string &rawValue) {
        return toLower(trim(rawValue));
    }
    
    std::vector<std::string> tokenizeIdentifier(const std::string &identifier) {
        std::vector<std::string> tokens;
        std::string current;
        
        auto flush = [&tokens, &current]() {
            if (!current.empty()) {
                tokens.push_back(toLower(current));
                current.clear();
            }
        };
        
        for (size_t i = 0; i < identifier.size(); i++) {
            char c = identifier[i];
            
            if (!isUpper(c) && !isLower(c) && !isDigit(c)) {
                flush();
                continue;
            }
            
            if (isUpper(c) && !current.empty()) {
                char prev = identifier[i - 1];
                bool nextIsLower = (i + 1 < identifier.size()) && isLower(identifier[i + 1]);
                
                // "itemName" => item | Name, "XMLName" => XML | Name
                if (isLower(prev) || isDigit(prev) || (isUpper(prev) && nextIsLower)) {
                    flush();
                }
            }
            
            current.push_back(c);
        }
        
        flush();
        
        return tokens;
    }
    
    bool globMatch(const std::string &pattern, const std::string &input) {
        size_t p = 0;
        size_t s = 0;
        size_t starPos = std::string::npos;
        size_t matchPos = 0;
        
        while (s < input.size()) {
            if (p < pattern.size() && (pattern[p] == '?' || lowerChar(pattern[p]) == lowerChar(input[s]))) {
                p++;
                s++;
            } else if (p < pattern.size() && pattern[p] == '*') {
                starPos = p++;
                matchPos = s;
            } else if (starPos != std::string::npos) {
                p = starPos + 1;
                s = ++matchPos;
            } else {
                return false;
            }
        }
        
        while (p < pattern.size() && pattern[p] == '*') {
            p++;
        }
        
        return p == pattern.size();
    }
}
