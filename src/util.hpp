#ifndef UTIL_HPP
#define UTIL_HPP

#include <ostream>
#include <iostream>
#include <vector>

#include "maxsat.hpp"

static const char* C_RESET = "\033[0m";
static const char* C_RED = "\033[31m";
static const char* C_GREEN = "\033[32m";
static const char* C_YELLOW = "\033[33m";
static const char* C_BLUE = "\033[34m";
static const char* C_CYAN = "\033[36m";
static const char* C_BOLD = "\033[1m";

template<class T> std::ostream& operator<<(std::ostream& os, const std::vector<T>& v) {
    os << "[ ";
    for (auto& el : v) {
        os << el << ", ";
    }
    os << "]";
    return os;
}


template<>
std::ostream& operator<<(std::ostream& os, const Assignment& v);
std::ostream& operator<<(std::ostream& os, const Literal& v);
std::ostream& operator<<(std::ostream& os, const Clause& v);

#endif
