#pragma once

#include <map>
#include <memory>
#include <string>

using MetricLabels = std::map<std::string, std::string>;

// Receives counters and histograms keyed by storage type. Calls are
// fire-and-forget: a failing sink never affects a job.
class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    virtual void incrementCounter(const std::string& name, const MetricLabels& labels) = 0;
    virtual void recordHistogram(const std::string& name, double value, const MetricLabels& labels) = 0;
};

using MetricsSinkPtr = std::shared_ptr<MetricsSink>;
