#include <langextract/engine/aggregator.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <numeric>
#include <unordered_map>

namespace langextract::engine {

using document::Extraction;

namespace {

bool participates(const Extraction& e) {
    return e.isGrounded() && !e.charInterval->empty();
}

// Union-find over extraction positions
class DisjointSet {
public:
    explicit DisjointSet(std::size_t n) : parent_(n) {
        std::iota(parent_.begin(), parent_.end(), 0);
    }

    std::size_t find(std::size_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    void unite(std::size_t a, std::size_t b) {
        a = find(a);
        b = find(b);
        if (a != b) {
            parent_[std::max(a, b)] = std::min(a, b);
        }
    }

private:
    std::vector<std::size_t> parent_;
};

} // namespace

const char* toString(OverlapStrategy strategy) {
    switch (strategy) {
        case OverlapStrategy::KeepHighestConfidence: return "highest_confidence";
        case OverlapStrategy::KeepLongest: return "longest";
        case OverlapStrategy::KeepFirst: return "first";
        case OverlapStrategy::MergeOverlapping: return "merge";
    }
    return "highest_confidence";
}

std::optional<OverlapStrategy> parseOverlapStrategy(std::string_view name) {
    for (auto s : {OverlapStrategy::KeepHighestConfidence, OverlapStrategy::KeepLongest,
                   OverlapStrategy::KeepFirst, OverlapStrategy::MergeOverlapping}) {
        if (name == toString(s)) {
            return s;
        }
    }
    return std::nullopt;
}

Aggregator::Aggregator(AggregationOptions options) : options_(options) {}

std::vector<Extraction> Aggregator::deduplicate(std::vector<Extraction> input) const {
    std::vector<Extraction> out;
    out.reserve(input.size());
    std::unordered_map<std::string, std::size_t> slot;

    for (auto& e : input) {
        auto key = e.dedupKey();
        auto it = slot.find(key);
        if (it == slot.end()) {
            slot.emplace(std::move(key), out.size());
            out.push_back(std::move(e));
        } else if (e.confidenceOrZero() > out[it->second].confidenceOrZero()) {
            out[it->second] = std::move(e);
        }
    }
    return out;
}

std::vector<Extraction> Aggregator::resolveOverlaps(std::vector<Extraction> input,
                                                    std::string_view sourceText) const {
    if (options_.overlapStrategy == OverlapStrategy::MergeOverlapping) {
        return mergeClusters(std::move(input), sourceText);
    }
    return keepGreedy(std::move(input));
}

std::vector<Extraction> Aggregator::keepGreedy(std::vector<Extraction> input) const {
    std::vector<std::size_t> order;
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (participates(input[i])) {
            order.push_back(i);
        }
    }

    auto start = [&](std::size_t i) { return input[i].charInterval->start; };
    auto length = [&](std::size_t i) { return input[i].charInterval->length(); };
    auto conf = [&](std::size_t i) { return input[i].confidenceOrZero(); };

    switch (options_.overlapStrategy) {
        case OverlapStrategy::KeepHighestConfidence:
            std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
                if (conf(a) != conf(b))
                    return conf(a) > conf(b);
                return start(a) < start(b);
            });
            break;
        case OverlapStrategy::KeepLongest:
            std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
                if (length(a) != length(b))
                    return length(a) > length(b);
                if (conf(a) != conf(b))
                    return conf(a) > conf(b);
                return start(a) < start(b);
            });
            break;
        case OverlapStrategy::KeepFirst:
        case OverlapStrategy::MergeOverlapping:
            std::stable_sort(order.begin(), order.end(),
                             [&](std::size_t a, std::size_t b) { return start(a) < start(b); });
            break;
    }

    std::vector<bool> keep(input.size(), true);
    std::vector<std::size_t> accepted;
    for (auto i : order) {
        const auto& span = *input[i].charInterval;
        bool clash = std::any_of(accepted.begin(), accepted.end(), [&](std::size_t a) {
            return input[a].charInterval->overlaps(span);
        });
        if (clash) {
            keep[i] = false;
        } else {
            accepted.push_back(i);
        }
    }

    std::vector<Extraction> out;
    out.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (keep[i]) {
            out.push_back(std::move(input[i]));
        }
    }
    return out;
}

std::vector<Extraction> Aggregator::mergeClusters(std::vector<Extraction> input,
                                                  std::string_view sourceText) const {
    DisjointSet sets(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (!participates(input[i])) {
            continue;
        }
        for (std::size_t j = i + 1; j < input.size(); ++j) {
            if (participates(input[j]) && input[i].charInterval->overlaps(*input[j].charInterval)) {
                sets.unite(i, j);
            }
        }
    }

    // Root is the smallest member index, so clusters surface at their first occurrence
    std::map<std::size_t, std::vector<std::size_t>> clusters;
    for (std::size_t i = 0; i < input.size(); ++i) {
        clusters[sets.find(i)].push_back(i);
    }

    std::vector<Extraction> out;
    out.reserve(clusters.size());
    for (auto& [root, members] : clusters) {
        if (members.size() == 1) {
            out.push_back(std::move(input[root]));
            continue;
        }

        // Highest confidence first; stable so ties favour the earlier member
        std::stable_sort(members.begin(), members.end(), [&](std::size_t a, std::size_t b) {
            return input[a].confidenceOrZero() > input[b].confidenceOrZero();
        });

        Extraction merged = input[members.front()];
        document::CharInterval span = *merged.charInterval;
        std::optional<double> confidence;
        for (auto m : members) {
            const auto& e = input[m];
            span = span.unionWith(*e.charInterval);
            if (e.confidence && (!confidence || *e.confidence > *confidence)) {
                confidence = e.confidence;
            }
            if (e.attributes.is_object()) {
                for (auto a = e.attributes.begin(); a != e.attributes.end(); ++a) {
                    if (!merged.attributes.contains(a.key())) {
                        merged.attributes[a.key()] = a.value();
                    }
                }
            }
        }

        merged.charInterval = span;
        merged.confidence = confidence;
        if (!sourceText.empty() && span.end <= sourceText.size()) {
            merged.text = std::string(sourceText.substr(span.start, span.length()));
            merged.alignmentStatus = document::AlignmentStatus::Exact;
            merged.alignmentQuality = 100.0;
        } else {
            std::vector<std::size_t> byStart = members;
            std::sort(byStart.begin(), byStart.end(), [&](std::size_t a, std::size_t b) {
                return input[a].charInterval->start < input[b].charInterval->start;
            });
            merged.text.clear();
            for (auto m : byStart) {
                if (!merged.text.empty()) {
                    merged.text += ' ';
                }
                merged.text += input[m].text;
            }
        }

        std::optional<document::TokenInterval> tokens;
        for (auto m : members) {
            const auto& t = input[m].tokenInterval;
            if (!t) {
                tokens.reset();
                break;
            }
            tokens = tokens ? document::TokenInterval{std::min(tokens->start, t->start),
                                                      std::max(tokens->end, t->end)}
                            : *t;
        }
        merged.tokenInterval = tokens;
        merged.index = input[root].index;

        out.push_back(std::move(merged));
    }
    return out;
}

std::vector<Extraction> Aggregator::filterByConfidence(std::vector<Extraction> input,
                                                       double threshold) const {
    std::vector<Extraction> out;
    out.reserve(input.size());
    for (auto& e : input) {
        if (e.confidence && *e.confidence < threshold) {
            continue;
        }
        out.push_back(std::move(e));
    }
    return out;
}

std::vector<Extraction> Aggregator::aggregate(std::vector<Extraction> input,
                                              std::string_view sourceText,
                                              AggregationStats* stats) const {
    AggregationStats local;
    local.originalCount = input.size();

    if (options_.enableDeduplication) {
        input = deduplicate(std::move(input));
    }
    local.duplicatesRemoved = local.originalCount - input.size();

    const auto beforeOverlap = input.size();
    input = resolveOverlaps(std::move(input), sourceText);
    local.overlapsResolved = beforeOverlap - input.size();

    const auto beforeFilter = input.size();
    input = filterByConfidence(std::move(input), options_.confidenceThreshold);
    local.lowConfidenceFiltered = beforeFilter - input.size();
    local.finalCount = input.size();

    spdlog::debug("aggregation: {} -> {} (dup {}, overlap {}, low confidence {})",
                  local.originalCount, local.finalCount, local.duplicatesRemoved,
                  local.overlapsResolved, local.lowConfidenceFiltered);
    if (stats) {
        *stats = local;
    }
    return input;
}

} // namespace langextract::engine
