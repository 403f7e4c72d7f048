#include <cstdlib>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "cnf.hpp"

using namespace std;

vector<string> split(const string &s, char delim) {
    vector<string> result{};
    stringstream ss(s);
    string item{};

    while (getline(ss, item, delim)) {
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

static int parseInt(const string& token, int lineNumber) {
    size_t parsed = 0;
    int value;
    try {
        value = stoi(token, &parsed);
    } catch (const logic_error&) {
        parsed = 0;
    }
    if (parsed == 0 || parsed != token.size()) {
        throw invalid_argument("line " + to_string(lineNumber) + ": invalid integer '" + token + "'");
    }
    return value;
}

CnfFormula readCnf(istream& input) {
    CnfFormula formula{0, 0, {}};
    string line{};
    int lineNumber = 0;

    while (getline(input, line)) {
        lineNumber++;
        replace(line.begin(), line.end(), '\t', ' ');
        replace(line.begin(), line.end(), '\r', ' ');
        auto parts = split(line, ' ');
        if (parts.empty() || parts[0][0] == 'c' || parts[0][0] == '%') { // Comment or end marker
            continue;
        }
        if (parts[0] == "p") {
            if (parts.size() < 4 || parts[1] != "cnf") {
                throw invalid_argument("line " + to_string(lineNumber) + ": expected 'p cnf <vars> <clauses>'");
            }
            formula.nVars = parseInt(parts[2], lineNumber);
            formula.nDeclaredClauses = parseInt(parts[3], lineNumber);
        } else {
            vector<int> clause;
            for (const string& litStr : parts) {
                int lit = parseInt(litStr, lineNumber);
                if (lit != 0) {
                    clause.push_back(lit);
                }
            }
            if (!clause.empty()) {
                formula.clauses.push_back(clause);
            }
        }
    }
    return formula;
}

CnfFormula readCnfFile(const string& filepath) {
    ifstream cnfFile(filepath);
    if (!cnfFile) {
        throw runtime_error("cannot open " + filepath);
    }
    return readCnf(cnfFile);
}

CnfStructure analyzeStructure(const vector<vector<int>>& clauses) {
    CnfStructure structure;
    structure.nClauses = clauses.size();
    for (const auto& clause : clauses) {
        structure.clauseLengths.push_back(clause.size());
        for (int lit : clause) {
            structure.variablesUsed.push_back(abs(lit));
        }
    }
    auto sortUnique = [](vector<int>& v) {
        sort(v.begin(), v.end());
        v.erase(unique(v.begin(), v.end()), v.end());
    };
    structure.uniqueClauseLengths = structure.clauseLengths;
    sortUnique(structure.uniqueClauseLengths);
    sortUnique(structure.variablesUsed);
    return structure;
}

SatProblem toSatProblem(const CnfFormula& formula) {
    vector<Clause> clauses;
    for (const auto& lits : formula.clauses) {
        clauses.push_back(clauseFromDimacs(lits));
    }
    return SatProblem(clauses, formula.nVars);
}
