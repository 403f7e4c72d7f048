#ifndef CNF_HPP
#define CNF_HPP

#include <istream>
#include <string>
#include <vector>

#include "maxsat.hpp"

struct CnfFormula {
    int nVars;
    int nDeclaredClauses; // As reported by the "p cnf" line, may differ from clauses.size()
    std::vector<std::vector<int>> clauses; // DIMACS literals, without the trailing 0
};

struct CnfStructure {
    int nClauses;
    std::vector<int> clauseLengths;
    std::vector<int> uniqueClauseLengths;
    std::vector<int> variablesUsed;
};

CnfFormula readCnf(std::istream& input);
CnfFormula readCnfFile(const std::string& filepath);

CnfStructure analyzeStructure(const std::vector<std::vector<int>>& clauses);
SatProblem toSatProblem(const CnfFormula&);

std::vector<std::string> split(const std::string& s, char delim);

#endif
