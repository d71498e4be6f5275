#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace order_voice {

class Metrics {
public:
    static Metrics& instance();

    void session_started();
    void session_finished();
    void session_refused();
    void set_transcript_subscribers(std::size_t count);
    void observe_response_time(const std::string& method, double seconds);
    void observe_response_summary(const std::string& method, double seconds);
    void observe_backend_error(const std::string& method);
    std::string render_prometheus() const;

private:
    struct SummarySeries {
        uint64_t count = 0;
        double sum = 0.0;
    };

    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    HistogramSeries& histogram_for(const std::string& method);
    SummarySeries& summary_for(const std::string& method);

    mutable std::mutex mutex_;
    uint64_t sessions_total_ = 0;
    uint64_t sessions_refused_ = 0;
    int64_t sessions_active_ = 0;
    uint64_t transcript_subscribers_ = 0;
    std::unordered_map<std::string, uint64_t> backend_errors_;
    std::unordered_map<std::string, SummarySeries> response_summaries_;
    std::unordered_map<std::string, HistogramSeries> response_histograms_;
    std::vector<double> histogram_bounds_;
};

}
