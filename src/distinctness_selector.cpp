#include "distinctness_selector.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <iterator>
#include <numeric>
#include <stdexcept>

namespace thumbgrid {

namespace {

void report(const DistinctnessSelector::ProgressCallback& progress, double fraction) {
    if (progress) {
        progress(fraction);
    }
}

std::vector<ExtractedFrame> pick(const std::vector<ExtractedFrame>& candidates,
                                 const std::vector<std::size_t>& indices) {
    std::vector<ExtractedFrame> result;
    result.reserve(indices.size());
    for (std::size_t idx : indices) {
        result.push_back(candidates[idx]);
    }
    return result;
}

} // namespace

DistinctnessSelector::DistinctnessSelector(const SelectionOptions& options,
                                           const MetricOptions& metric_options)
    : options_(options)
    , metric_computer_(metric_options) {
    if (options_.yield_every < 1) {
        options_.yield_every = 1;
    }
}

std::vector<std::size_t> DistinctnessSelector::evenly_spaced_indices(std::size_t candidate_count,
                                                                     std::size_t requested_count) {
    std::vector<std::size_t> indices;
    if (candidate_count == 0 || requested_count == 0) {
        return indices;
    }
    indices.reserve(requested_count);
    for (std::size_t i = 0; i < requested_count; ++i) {
        indices.push_back(std::min(i * candidate_count / requested_count, candidate_count - 1));
    }
    return indices;
}

std::vector<std::size_t> DistinctnessSelector::comparison_indices(std::size_t index, std::size_t total) {
    std::vector<std::size_t> indices;
    if (total < 2 || index >= total) {
        return indices;
    }

    if (index > 0) {
        indices.push_back(index - 1);
    }
    if (index + 1 < total) {
        indices.push_back(index + 1);
    }

    const std::size_t distant[3] = {total / 4, total / 2, (total * 3) / 4};
    for (std::size_t candidate : distant) {
        if (indices.size() >= 5) {
            break;
        }
        if (candidate == index || candidate >= total) {
            continue;
        }
        if (std::find(indices.begin(), indices.end(), candidate) != indices.end()) {
            continue;
        }
        indices.push_back(candidate);
    }
    return indices;
}

double DistinctnessSelector::pair_score(const FrameMetrics& a, const FrameMetrics& b) const {
    const ScoreWeights& w = options_.weights;
    double score = std::abs(a.brightness - b.brightness) * w.brightness
                 + std::abs(a.color_variance - b.color_variance) * w.color_variance;

    if (w.edge_density > 0.0 && a.edge_density && b.edge_density) {
        score += std::abs(*a.edge_density - *b.edge_density) * w.edge_density;
    }
    if (w.histogram > 0.0 && a.histogram && b.histogram) {
        double l1 = 0.0;
        for (std::size_t i = 0; i < a.histogram->size(); ++i) {
            l1 += std::abs((*a.histogram)[i] - (*b.histogram)[i]);
        }
        score += 0.5 * l1 * w.histogram;
    }
    return score;
}

bool DistinctnessSelector::passes_quality_filter(const FrameMetrics& metrics) const {
    bool good_brightness = metrics.brightness > options_.min_brightness &&
                           metrics.brightness < options_.max_brightness;
    bool has_variety = metrics.color_variance > options_.min_color_variance;
    return good_brightness && has_variety;
}

std::vector<ExtractedFrame> DistinctnessSelector::select(const std::vector<ExtractedFrame>& candidates,
                                                         int requested_count,
                                                         const CancellationToken& token,
                                                         const ProgressCallback& progress) const {
    if (requested_count < 1) {
        throw std::invalid_argument("Requested frame count must be positive");
    }
    const auto count = static_cast<std::size_t>(requested_count);

    if (candidates.size() <= count) {
        report(progress, 1.0);
        return candidates;
    }

    if (requested_count <= options_.fast_path_max) {
        report(progress, 1.0);
        return pick(candidates, evenly_spaced_indices(candidates.size(), count));
    }

    std::cout << "Starting distinctness selection: " << candidates.size()
              << " candidates -> " << count << " needed" << std::endl;
    report(progress, 0.1);

    std::vector<FrameMetrics> metrics;
    metrics.reserve(candidates.size());
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (i % static_cast<std::size_t>(options_.yield_every) == 0) {
            cooperative_yield(token);
        }
        if (auto m = metric_computer_.compute(candidates[i].image, i)) {
            metrics.push_back(*m);
        }
    }
    report(progress, 0.3);

    if (metrics.size() <= count) {
        std::cout << "Only " << metrics.size() << " frames produced metrics, using all of them" << std::endl;
        std::vector<std::size_t> usable;
        usable.reserve(metrics.size());
        for (const auto& m : metrics) {
            usable.push_back(m.index);
        }
        report(progress, 1.0);
        return pick(candidates, usable);
    }

    std::vector<FrameMetrics> filtered;
    filtered.reserve(metrics.size());
    std::copy_if(metrics.begin(), metrics.end(), std::back_inserter(filtered),
        [this](const FrameMetrics& m) { return passes_quality_filter(m); });

    const std::vector<FrameMetrics>* to_score = &filtered;
    if (filtered.size() < count) {
        std::cout << "Quality filter too aggressive (" << filtered.size() << " < " << count
                  << "), scoring all " << metrics.size() << " frames" << std::endl;
        to_score = &metrics;
    } else {
        std::cout << "Quality filter: " << metrics.size() << " -> " << filtered.size()
                  << " frames (removed " << (metrics.size() - filtered.size())
                  << " fade/blank frames)" << std::endl;
    }
    report(progress, 0.5);

    const std::vector<FrameMetrics>& scoring_set = *to_score;
    const std::size_t total = scoring_set.size();

    std::vector<std::pair<std::size_t, double>> scores;
    scores.reserve(total);

    for (std::size_t i = 0; i < total; ++i) {
        if (i % static_cast<std::size_t>(options_.yield_every) == 0) {
            cooperative_yield(token);
            report(progress, 0.5 + (static_cast<double>(i) / static_cast<double>(total)) * 0.4);
        }

        const auto partners = comparison_indices(i, total);
        double total_score = 0.0;
        for (std::size_t partner : partners) {
            total_score += pair_score(scoring_set[i], scoring_set[partner]);
        }
        double average = partners.empty() ? 0.0 : total_score / static_cast<double>(partners.size());
        scores.emplace_back(scoring_set[i].index, average);
    }

    // Stable so equal scores keep chronological precedence.
    std::stable_sort(scores.begin(), scores.end(),
        [](const auto& a, const auto& b) { return a.second > b.second; });
    scores.resize(count);

    double mean_score = std::accumulate(scores.begin(), scores.end(), 0.0,
        [](double acc, const auto& s) { return acc + s.second; }) / static_cast<double>(count);
    std::cout << "Selected " << count << " most distinct frames (avg score: "
              << mean_score << ")" << std::endl;

    std::vector<std::size_t> selected;
    selected.reserve(count);
    for (const auto& s : scores) {
        selected.push_back(s.first);
    }
    std::sort(selected.begin(), selected.end());

    report(progress, 1.0);
    return pick(candidates, selected);
}

} // namespace thumbgrid
