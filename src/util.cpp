#include "util.hpp"
#include "maxsat.hpp"

using namespace std;

// Variables in DIMACS form: positive if true, negative if false
template<>
std::ostream& operator<<(std::ostream& os, const Assignment& v) {
    os << "[ ";
    for (int iVar = 0; iVar < (int)v.size(); iVar++) {
        if (v[iVar] == UNASSIGNED) {
            os << "?" << (iVar+1) << ", ";
        } else {
            os << (v[iVar] == VAR_TRUE ? (iVar+1) : -(iVar+1)) << ", ";
        }
    }
    os << "]";
    return os;
}

std::ostream& operator<<(std::ostream& os, const Literal& v) {
    os << v.toDimacs();
    return os;
}

std::ostream& operator<<(std::ostream& os, const Clause& v) {
    os << "(";
    for (int i = 0; i < v.size(); i++) {
        os << (i ? " v " : "") << v.literals[i];
    }
    os << ")";
    return os;
}
