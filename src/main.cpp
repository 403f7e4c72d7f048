#include <cstdlib>
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <algorithm>
#include <filesystem>
#include <stdexcept>

#include "tclap/CmdLine.h"

#include "maxsat.hpp"
#include "cnf.hpp"
#include "graph.hpp"
#include "community.hpp"
#include "pipeline.hpp"
#include "util.hpp"

using namespace std;
using namespace TCLAP;
namespace fs = std::filesystem;

vector<string> listCnfFiles(const string& dataPath) {
    vector<string> dataFiles;
    if (!fs::is_directory(dataPath)) {
        dataFiles.push_back(dataPath);
        return dataFiles;
    }
    for (const auto& dataFile : fs::directory_iterator(dataPath)) {
        string dataFilePath = dataFile.path();
        if (split(dataFilePath, '.').back() == "cnf") {
            dataFiles.push_back(dataFilePath);
        }
    }
    sort(dataFiles.begin(), dataFiles.end());
    return dataFiles;
}

void printStructure(const CnfFormula& formula) {
    CnfStructure structure = analyzeStructure(formula.clauses);
    cout << "  variables=" << formula.nVars << "  clauses=" << formula.nDeclaredClauses;
    if (structure.nClauses != formula.nDeclaredClauses) {
        cout << C_YELLOW << " (" << structure.nClauses << " read)" << C_RESET;
    }
    cout << "  clause lengths=" << structure.uniqueClauseLengths
        << "  used variables=" << structure.variablesUsed.size() << endl;

    cout << "  bounds: random (7/8)=" << setprecision(4) << structure.nClauses * 7. / 8
        << "  best known (8/9)=" << structure.nClauses * 8. / 9 << endl;
}

int main(int argc, char** argv) {
    cout << C_CYAN;
    for (const string& part : vector<string>(argv, argv+argc)) {
        cout << part << " ";
    }
    cout << C_RESET << endl;

    string dataPath = "instances";
    PipelineSettings settings{};

    vector<string> weightFunctions = weightFunctionNames();
    ValuesConstraint<string> weightFunctionsConstraint(weightFunctions);

	try {
	    CmdLine cmd("Community-guided MAX-3SAT solver", ' ', "0.1");

        // Create the CMD arguments
    	ValueArg<string> dataPathArg("", "data", "CNF file, or directory of .cnf files",
            false, dataPath, "path", cmd);

    	ValueArg<int> seedArg("s", "seed", "Random generator seed", false, settings.seed, "integer", cmd);

        SwitchArg weightedSwitch("", "weighted",
            "Use the weighted conflict graph and weighted label propagation", cmd, false);

    	ValueArg<int> minConflictsArg("k", "min_conflicts",
            "Minimum number of conflicting literals to link two clauses",
            false, settings.minConflicts, "integer", cmd);

    	ValueArg<string> weightFunctionArg("", "weight_fn",
            "Transform from conflict count to edge weight (weighted graph only)",
            false, settings.weightFunction, &weightFunctionsConstraint, cmd);

    	ValueArg<int> maxIterationsArg("i", "max_iterations",
            "Maximum number of label propagation passes",
            false, settings.maxIterations, "integer", cmd);

    	ValueArg<int> trialsArg("n", "trials",
            "Number of random assignments of the baseline solver",
            false, settings.baselineTrials, "integer", cmd);

        SwitchArg debugSwitch("", "debug", "Print graph and community details", cmd, false);

        // Parse the CMD arguments
	    cmd.parse(argc, argv);

        dataPath = dataPathArg.getValue();
        settings.seed = seedArg.getValue();
        settings.weighted = weightedSwitch.getValue();
        settings.minConflicts = minConflictsArg.getValue();
        settings.weightFunction = weightFunctionArg.getValue();
        settings.maxIterations = maxIterationsArg.getValue();
        settings.baselineTrials = trialsArg.getValue();
        settings.debug = debugSwitch.getValue();

	} catch (ArgException &e) {
        cerr << "error: " << e.error() << " for arg " << e.argId() << endl;
        return -1;
    }

    vector<string> dataFiles;
    try {
        dataFiles = listCnfFiles(dataPath);
    } catch (const fs::filesystem_error& e) {
        cerr << C_RED << "error: " << e.what() << C_RESET << endl;
        return -1;
    }

    cout << "Using data from " << dataPath << " (" << dataFiles.size() << " test files)" << endl;
    double totalScore = 0, totalBaseline = 0, totalTime = 0;
    int nbSolved = 0;

    for (int iFile = 0; iFile < (int)dataFiles.size(); iFile++) {
        cout << "Running " << (settings.weighted ? "weighted" : "unweighted") << " communities on file "
            << (iFile+1) << "/" << dataFiles.size() << " [" << dataFiles[iFile] << "]" << endl;

        CnfFormula formula;
        try {
            formula = readCnfFile(dataFiles[iFile]);
        } catch (const exception& e) {
            cerr << C_RED << "error: " << e.what() << ", skipping file" << C_RESET << endl;
            continue;
        }
        printStructure(formula);

        SatProblem problem = toSatProblem(formula);
        PipelineResult result = runPipeline(settings, problem);
        const vector<int>& sizes = result.communitySizes;

        cout << "  edges=" << result.nEdges << "  communities=" << nbCommunities(result.communities)
            << "  largest=" << vector<int>(sizes.begin(), sizes.begin() + min((int)sizes.size(), 5)) << endl;
        if (settings.debug) {
            cout << "  assignment=" << result.solution.assignment << endl;
        }

        int improvement = result.solution.score - result.baseline.score;
        const char* color = improvement > 0 ? C_GREEN : (improvement < 0 ? C_RED : C_YELLOW);
        cout << "score=" << result.solution.score << "/" << problem.nClauses
            << "  baseline=" << result.baseline.score
            << "  (" << color << (improvement > 0 ? "+" : "") << improvement << C_RESET << ")"
            << "  time=" << C_CYAN << setprecision(3) << result.runTime << "s" << C_RESET << endl;
        if (result.solution.score == problem.nClauses) {
            cout << C_BOLD << C_GREEN << "  all clauses satisfied" << C_RESET << endl;
        }

        nbSolved++;
        totalScore += result.solution.score;
        totalBaseline += result.baseline.score;
        totalTime += result.runTime;
        cout << "  (avg=" << C_GREEN << setprecision(6) << (totalScore / nbSolved) << C_RESET
            << ", avg_baseline=" << (totalBaseline / nbSolved)
            << ", avg_time=" << C_CYAN << setprecision(3) << (totalTime / nbSolved) << "s" << C_RESET
            << ")" << endl;
    }
    if (nbSolved == 0) {
        cerr << C_RED << "No instance solved" << C_RESET << endl;
        return 1;
    }
    cout << "Final average score is " << C_GREEN << setprecision(6) << (totalScore / nbSolved) << C_RESET
        << " (baseline " << (totalBaseline / nbSolved) << ")"
        << "    (avg_time=" << C_CYAN << setprecision(3) << (totalTime / nbSolved) << "s" << C_RESET
        << ", total_time=" << C_CYAN << ((int)totalTime) << "s" << C_RESET
        << ")" << endl;
    return 0;
}
