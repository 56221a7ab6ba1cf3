/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hashbreaker/metrics.hpp"
#include "hashbreaker/logger.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>

namespace hashbreaker {

namespace {

const std::vector<double>& jobBuckets() {
    static const std::vector<double> b = {1, 5, 10, 30, 60, 120, 300, 600};
    return b;
}

const std::vector<double>& phaseBuckets() {
    static const std::vector<double> b = {1, 5, 10, 20, 30, 60, 120, 300};
    return b;
}

std::string escapeLabel(const std::string& value) {
    std::string out;
    for (char c : value) {
        if (c == '\\' || c == '"') out += '\\';
        if (c == '\n') {
            out += "\\n";
            continue;
        }
        out += c;
    }
    return out;
}

void renderHistograms(std::ostringstream& out, const char* name, const char* help, const char* label,
                      const std::map<std::string, Histogram>& series) {
    out << "# HELP " << name << " " << help << "\n";
    out << "# TYPE " << name << " histogram\n";
    for (const auto& [value, h] : series) {
        const std::string lbl = std::string(label) + "=\"" + escapeLabel(value) + "\"";
        std::uint64_t cumulative = 0;
        for (std::size_t i = 0; i < h.bounds.size(); ++i) {
            cumulative += h.counts[i];
            out << name << "_bucket{" << lbl << ",le=\"" << h.bounds[i] << "\"} " << cumulative << "\n";
        }
        out << name << "_bucket{" << lbl << ",le=\"+Inf\"} " << h.count << "\n";
        out << name << "_sum{" << lbl << "} " << h.sum << "\n";
        out << name << "_count{" << lbl << "} " << h.count << "\n";
    }
    out << "\n";
}

} // namespace

Histogram::Histogram(std::vector<double> upperBounds)
    : bounds(std::move(upperBounds)), counts(bounds.size(), 0) {}

void Histogram::observe(double value) {
    for (std::size_t i = 0; i < bounds.size(); ++i) {
        if (value <= bounds[i]) {
            ++counts[i];
            break;
        }
    }
    ++count;
    sum += value;
}

Metrics::Metrics() {
    for (Priority p : {Priority::High, Priority::Normal, Priority::Low}) {
        queueDepth_[toString(p)] = 0;
    }
}

void Metrics::jobFinished(Status status, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string key = toString(status);
    ++jobsTotal_[key];
    auto it = jobDuration_.find(key);
    if (it == jobDuration_.end()) {
        it = jobDuration_.emplace(key, Histogram(jobBuckets())).first;
    }
    it->second.observe(seconds);
}

void Metrics::phaseFinished(const std::string& phase, double seconds, std::int64_t guesses) {
    std::lock_guard<std::mutex> lock(mutex_);
    guessesTotal_[phase] += guesses;
    auto it = phaseDuration_.find(phase);
    if (it == phaseDuration_.end()) {
        it = phaseDuration_.emplace(phase, Histogram(phaseBuckets())).first;
    }
    it->second.observe(seconds);
}

void Metrics::jobsRunningDelta(int delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    jobsRunning_ += delta;
}

void Metrics::queueDepth(Priority priority, std::size_t depth) {
    std::lock_guard<std::mutex> lock(mutex_);
    queueDepth_[toString(priority)] = depth;
}

std::uint64_t Metrics::jobsTotal(Status status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobsTotal_.find(toString(status));
    return it == jobsTotal_.end() ? 0 : it->second;
}

std::int64_t Metrics::guessesTotal(const std::string& phase) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = guessesTotal_.find(phase);
    return it == guessesTotal_.end() ? 0 : it->second;
}

std::uint64_t Metrics::jobDurationCount(Status status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobDuration_.find(toString(status));
    return it == jobDuration_.end() ? 0 : it->second.count;
}

std::uint64_t Metrics::phaseDurationCount(const std::string& phase) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = phaseDuration_.find(phase);
    return it == phaseDuration_.end() ? 0 : it->second.count;
}

int Metrics::jobsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobsRunning_;
}

std::string Metrics::renderPrometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;

    out << "# HELP hash_breaker_jobs_total Total number of jobs processed\n";
    out << "# TYPE hash_breaker_jobs_total counter\n";
    for (const auto& [status, n] : jobsTotal_) {
        out << "hash_breaker_jobs_total{status=\"" << status << "\"} " << n << "\n";
    }
    out << "\n";

    out << "# HELP hash_breaker_guesses_total Total password guesses made\n";
    out << "# TYPE hash_breaker_guesses_total counter\n";
    for (const auto& [phase, n] : guessesTotal_) {
        out << "hash_breaker_guesses_total{phase=\"" << escapeLabel(phase) << "\"} " << n << "\n";
    }
    out << "\n";

    out << "# HELP hash_breaker_jobs_running Jobs currently being processed\n";
    out << "# TYPE hash_breaker_jobs_running gauge\n";
    out << "hash_breaker_jobs_running " << jobsRunning_ << "\n\n";

    out << "# HELP hash_breaker_queue_depth Current queue depth by priority\n";
    out << "# TYPE hash_breaker_queue_depth gauge\n";
    for (const auto& [priority, depth] : queueDepth_) {
        out << "hash_breaker_queue_depth{priority=\"" << priority << "\"} " << depth << "\n";
    }
    out << "\n";

    renderHistograms(out, "hash_breaker_job_duration_seconds", "Job execution duration", "status", jobDuration_);
    renderHistograms(out, "hash_breaker_phase_duration_seconds", "Phase execution duration", "phase", phaseDuration_);

    return out.str();
}

bool Metrics::writeTo(const std::filesystem::path& path) const noexcept {
    try {
        auto temp = path;
        temp += ".tmp";
        {
            std::ofstream file(temp, std::ios::binary | std::ios::trunc);
            if (!file) return false;
            file << renderPrometheus();
            file.flush();
            if (!file.good()) return false;
        }
        std::filesystem::rename(temp, path);
        return true;
    } catch (const std::exception& e) {
        LOG_WARN("Cannot write metrics to " + path.string() + ": " + e.what());
        return false;
    }
}

} // namespace hashbreaker
