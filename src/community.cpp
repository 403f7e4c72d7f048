#include <algorithm>
#include <numeric>
#include <map>

#include "community.hpp"

using namespace std;

// Map old labels to 1..k, keeping the order of the label values
static vector<int> renumberLabels(const vector<int>& labels) {
    vector<int> uniqueLabels = labels;
    sort(uniqueLabels.begin(), uniqueLabels.end());
    uniqueLabels.erase(unique(uniqueLabels.begin(), uniqueLabels.end()), uniqueLabels.end());

    map<int, int> labelMapping;
    for (int i = 0; i < (int)uniqueLabels.size(); i++) {
        labelMapping[uniqueLabels[i]] = i+1;
    }
    vector<int> result;
    for (int label : labels) {
        result.push_back(labelMapping[label]);
    }
    return result;
}

static vector<int> propagateLabels(const ClauseGraph& graph, int maxIterations, int seed, bool useWeights) {
    int n = graph.nVertices();
    if (n == 0) {
        return {};
    } else if (n == 1) {
        return {1};
    }
    Rng rng(seed);
    vector<int> labels(n);
    iota(labels.begin(), labels.end(), 1);

    vector<int> visitOrder(n);
    iota(visitOrder.begin(), visitOrder.end(), 0);

    bool changed = true;
    for (int iter = 0; changed && iter < maxIterations; iter++) {
        changed = false;
        // Fisher-Yates on raw mt19937 output, which is the same on every standard library
        for (int i = n-1; i > 0; i--) {
            swap(visitOrder[i], visitOrder[rng() % (i+1)]);
        }

        for (int v : visitOrder) {
            const vector<int>& neighbours = graph.neighbours(v);
            if (neighbours.empty()) {
                continue;
            }
            map<int, double> votes; // label -> total vote
            for (int i = 0; i < (int)neighbours.size(); i++) {
                votes[labels[neighbours[i]]] += useWeights ? graph.weight(v, i) : 1.;
            }
            // Labels are visited in increasing order, so ties keep the smallest one
            int bestLabel = votes.begin()->first;
            double bestVote = votes.begin()->second;
            for (auto& labelVote : votes) {
                if (labelVote.second > bestVote) {
                    bestLabel = labelVote.first;
                    bestVote = labelVote.second;
                }
            }
            if (bestLabel != labels[v]) {
                labels[v] = bestLabel;
                changed = true;
            }
        }
    }
    return renumberLabels(labels);
}

vector<int> detectCommunities(const ClauseGraph& graph, int maxIterations, int seed) {
    return propagateLabels(graph, maxIterations, seed, false);
}

vector<int> weightedDetectCommunities(const ClauseGraph& graph, int maxIterations, int seed) {
    return propagateLabels(graph, maxIterations, seed, true);
}


int nbCommunities(const vector<int>& labels) {
    return communitySizes(labels).size();
}

vector<int> communitySizes(const vector<int>& labels) {
    map<int, int> sizeOf;
    for (int label : labels) {
        sizeOf[label]++;
    }
    vector<int> sizes;
    for (auto& labelSize : sizeOf) {
        sizes.push_back(labelSize.second);
    }
    sort(sizes.rbegin(), sizes.rend());
    return sizes;
}
