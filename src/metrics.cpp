#include "order_voice/metrics.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace order_voice {

namespace {

template <typename Map>
std::vector<std::string> sorted_keys(const Map& map) {
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& item : map) {
        keys.push_back(item.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

}

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.05, 0.1, 0.25, 0.5, 0.75, 1.0, 1.5, 2.0,
                         3.0, 5.0, 7.5, 10.0, 30.0, 60.0};
}

void Metrics::session_started() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++sessions_total_;
    ++sessions_active_;
}

void Metrics::session_finished() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_active_ > 0) {
        --sessions_active_;
    }
}

void Metrics::session_refused() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++sessions_refused_;
}

void Metrics::set_transcript_subscribers(std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    transcript_subscribers_ = count;
}

Metrics::HistogramSeries& Metrics::histogram_for(const std::string& method) {
    auto& series = response_histograms_[method];
    if (series.buckets.empty()) {
        series.buckets.assign(histogram_bounds_.size() + 1, 0);
    }
    return series;
}

Metrics::SummarySeries& Metrics::summary_for(const std::string& method) {
    return response_summaries_[method];
}

void Metrics::observe_response_time(const std::string& method, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = histogram_for(method);
    histogram.count += 1;
    histogram.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            histogram.buckets[i] += 1;
        }
    }
    histogram.buckets.back() += 1;
}

void Metrics::observe_response_summary(const std::string& method, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& summary = summary_for(method);
    summary.count += 1;
    summary.sum += seconds;
}

void Metrics::observe_backend_error(const std::string& method) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++backend_errors_[method];
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP voice_sessions_total Voice sessions started\n";
    out << "# TYPE voice_sessions_total counter\n";
    out << "voice_sessions_total " << sessions_total_ << "\n";

    out << "# HELP voice_sessions_refused_total Voice sessions refused for missing credentials\n";
    out << "# TYPE voice_sessions_refused_total counter\n";
    out << "voice_sessions_refused_total " << sessions_refused_ << "\n";

    out << "# HELP voice_sessions_active Voice sessions currently running\n";
    out << "# TYPE voice_sessions_active gauge\n";
    out << "voice_sessions_active " << sessions_active_ << "\n";

    out << "# HELP transcript_subscribers Connected transcript observers\n";
    out << "# TYPE transcript_subscribers gauge\n";
    out << "transcript_subscribers " << transcript_subscribers_ << "\n";

    out << "# HELP backend_errors_total Failed backend calls\n";
    out << "# TYPE backend_errors_total counter\n";
    for (const auto& method : sorted_keys(backend_errors_)) {
        out << "backend_errors_total{method=\"" << method << "\"} "
            << backend_errors_.at(method) << "\n";
    }

    out << "# HELP backend_response_summary Backend response time in seconds\n";
    out << "# TYPE backend_response_summary summary\n";
    for (const auto& method : sorted_keys(response_summaries_)) {
        const auto& series = response_summaries_.at(method);
        out << "backend_response_summary_count{method=\"" << method << "\"} "
            << series.count << "\n";
        out << "backend_response_summary_sum{method=\"" << method << "\"} "
            << series.sum << "\n";
    }

    out << "# HELP backend_response_seconds Backend response time in seconds\n";
    out << "# TYPE backend_response_seconds histogram\n";
    for (const auto& method : sorted_keys(response_histograms_)) {
        const auto& series = response_histograms_.at(method);
        for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
            out << "backend_response_seconds_bucket{method=\"" << method
                << "\",le=\"" << histogram_bounds_[i] << "\"} "
                << series.buckets[i] << "\n";
        }
        out << "backend_response_seconds_bucket{method=\"" << method
            << "\",le=\"+Inf\"} " << series.buckets.back() << "\n";
        out << "backend_response_seconds_count{method=\"" << method << "\"} "
            << series.count << "\n";
        out << "backend_response_seconds_sum{method=\"" << method << "\"} "
            << series.sum << "\n";
    }

    return out.str();
}

}
