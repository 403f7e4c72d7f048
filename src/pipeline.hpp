#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include <vector>
#include <string>

#include "maxsat.hpp"
#include "graph.hpp"
#include "solver.hpp"

/*
    Settings
*/

struct PipelineSettings {
    int seed;
    bool weighted; // Weighted graph + weighted label propagation
    int minConflicts;
    std::string weightFunction; // linear, quadratic, cubic, exponential, log
    int maxIterations; // Label propagation passes
    int baselineTrials;
    bool debug;

    PipelineSettings();
};


/*
    Results
*/

struct PipelineResult {
    int nEdges;
    std::vector<int> communities; // Label of each clause
    std::vector<int> communitySizes;
    SolveResult solution;
    SolveResult baseline;
    double runTime; // Seconds, graph + communities + community solver
};

PipelineResult runPipeline(const PipelineSettings&, const SatProblem&);

#endif
