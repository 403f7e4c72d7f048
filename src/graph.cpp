#include <cmath>
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <limits>

#include "graph.hpp"
#include "util.hpp"

using namespace std;

ClauseGraph::ClauseGraph(int nVertices, bool isWeighted)
    :weighted(isWeighted), edgeCount(0), adjacency(max(nVertices, 0)) {
    if (weighted) {
        weights = vector<vector<double>>(adjacency.size());
    }
}

double ClauseGraph::weight(int v, int iNeighbour) const {
    return weighted ? weights[v][iNeighbour] : 1.;
}

bool ClauseGraph::hasEdge(int u, int v) const {
    const vector<int>& adj = adjacency[u];
    return find(adj.begin(), adj.end(), v) != adj.end();
}

double ClauseGraph::edgeWeight(int u, int v) const {
    const vector<int>& adj = adjacency[u];
    for (int i = 0; i < (int)adj.size(); i++) {
        if (adj[i] == v) {
            return weight(u, i);
        }
    }
    return 0;
}

vector<pair<int, int>> ClauseGraph::edges() const {
    vector<pair<int, int>> result;
    for (int u = 0; u < nVertices(); u++) {
        for (int v : adjacency[u]) {
            if (u < v) {
                result.push_back({u, v});
            }
        }
    }
    sort(result.begin(), result.end());
    return result;
}

void ClauseGraph::addEdge(int u, int v, double w) {
    if (u == v || hasEdge(u, v)) {
        return;
    }
    adjacency[u].push_back(v);
    adjacency[v].push_back(u);
    if (weighted) {
        weights[u].push_back(w);
        weights[v].push_back(w);
    }
    edgeCount++;
}


int conflictCount(const Clause& cls, const Clause& other) {
    int conflicts = 0;
    for (const Literal& lit : cls) {
        if (other.contains(lit.negated())) {
            conflicts++;
        }
    }
    return conflicts;
}

static double edgeWeightFor(int conflicts, const WeightFunction& weightFunction, bool debug) {
    if (!weightFunction) {
        return conflicts;
    }
    double weight;
    try {
        weight = weightFunction(conflicts);
    } catch (const exception& e) {
        if (debug) {
            cerr << C_YELLOW << "  weight function failed (" << e.what() << "), using "
                << conflicts << C_RESET << endl;
        }
        return conflicts;
    }
    if (!isfinite(weight) || weight <= 0) {
        if (debug) {
            cerr << C_YELLOW << "  invalid weight " << weight << ", using " << conflicts << C_RESET << endl;
        }
        return conflicts;
    }
    return weight;
}

ClauseGraph buildConflictGraph(const SatProblem& pb, bool weighted, int minConflicts,
        const WeightFunction& weightFunction, bool debug) {
    if (debug) {
        cerr << C_BLUE << "Building " << (weighted ? "weighted" : "unweighted") << " conflict graph: "
            << pb.nClauses << " clauses, " << pb.nVars << " variables, min_conflicts="
            << minConflicts << C_RESET << endl;
    }
    ClauseGraph graph(pb.nClauses, weighted);
    if (weighted) {
        minConflicts = max(minConflicts, 1); // A conflict-free edge would fall back to weight 0
    }

    // Conflicts are symmetric: a literal of i negated in j is a literal of j negated in i
    for (int i = 0; i < pb.nClauses; i++) {
        for (int j = i+1; j < pb.nClauses; j++) {
            int conflicts = conflictCount(pb.clauses[i], pb.clauses[j]);
            bool traced = debug && (i < 3 || j < 3);
            if (traced && conflicts > 0) {
                cerr << "  clauses " << (i+1) << " " << pb.clauses[i]
                    << " and " << (j+1) << " " << pb.clauses[j] << endl;
            }
            if (conflicts < minConflicts) {
                if (traced && conflicts > 0) {
                    cerr << "  skipping " << (i+1) << "-" << (j+1) << ": " << conflicts
                        << " conflicts < " << minConflicts << endl;
                }
                continue;
            }
            double weight = weighted ? edgeWeightFor(conflicts, weightFunction, debug) : 1.;
            graph.addEdge(i, j, weight);
            if (traced) {
                cerr << "  edge " << (i+1) << "-" << (j+1) << ": " << conflicts << " conflicts";
                if (weighted) {
                    cerr << ", weight " << weight;
                }
                cerr << endl;
            }
        }
    }

    if (debug) {
        cerr << C_BLUE << "Graph: " << graph.nVertices() << " vertices, " << graph.nEdges() << " edges";
        if (weighted && graph.nEdges() > 0) {
            double minWeight = numeric_limits<double>::infinity(), maxWeight = 0;
            for (auto& edge : graph.edges()) {
                double w = graph.edgeWeight(edge.first, edge.second);
                minWeight = min(minWeight, w);
                maxWeight = max(maxWeight, w);
            }
            cerr << ", weights in [" << minWeight << "; " << maxWeight << "]";
        }
        cerr << C_RESET << endl;
    }
    return graph;
}


vector<string> weightFunctionNames() {
    return {"linear", "quadratic", "cubic", "exponential", "log"};
}

WeightFunction weightFunctionByName(const string& name) {
    if (name == "linear") {
        return [](int x) { return (double)x; };
    } else if (name == "quadratic") {
        return [](int x) { return (double)x * x; };
    } else if (name == "cubic") {
        return [](int x) { return (double)x * x * x; };
    } else if (name == "exponential") {
        return [](int x) { return pow(2., x); };
    } else if (name == "log") {
        return [](int x) { return log(x + 1.); };
    }
    throw invalid_argument("unknown weight function: " + name);
}
