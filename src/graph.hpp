#ifndef GRAPH_HPP
#define GRAPH_HPP

#include <vector>
#include <string>
#include <utility>
#include <functional>

#include "maxsat.hpp"

using WeightFunction = std::function<double(int)>;

/*
    Clause graph: one vertex per clause index.
    An unweighted graph stores no weights and reports 1.0 for every edge.
*/
struct ClauseGraph {
    ClauseGraph(int nVertices, bool weighted);

    bool isWeighted() const { return weighted; }
    int nVertices() const { return (int)adjacency.size(); }
    int nEdges() const { return edgeCount; }

    const std::vector<int>& neighbours(int v) const { return adjacency[v]; }
    double weight(int v, int iNeighbour) const;
    bool hasEdge(int u, int v) const;
    double edgeWeight(int u, int v) const; // 0 if the edge does not exist
    std::vector<std::pair<int, int>> edges() const; // (u, v) with u < v

    void addEdge(int u, int v, double w = 1.);

private:
    bool weighted;
    int edgeCount;
    std::vector<std::vector<int>> adjacency;
    std::vector<std::vector<double>> weights; // Parallel to adjacency, empty if unweighted
};

int conflictCount(const Clause& cls, const Clause& other);

ClauseGraph buildConflictGraph(const SatProblem& pb, bool weighted = false, int minConflicts = 2,
    const WeightFunction& weightFunction = nullptr, bool debug = false);

// Named transforms: linear, quadratic, cubic, exponential, log
std::vector<std::string> weightFunctionNames();
WeightFunction weightFunctionByName(const std::string& name);

#endif
