/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hashbreaker/pipeline.hpp"
#include "hashbreaker/errors.hpp"
#include "hashbreaker/logger.hpp"

namespace hashbreaker {

namespace {

// Keeps the jobs_running gauge balanced on every exit path.
class RunningGauge final {
public:
    explicit RunningGauge(MetricsSink& metrics) : metrics_(metrics) { metrics_.jobsRunningDelta(1); }
    ~RunningGauge() { metrics_.jobsRunningDelta(-1); }

    RunningGauge(const RunningGauge&) = delete;
    RunningGauge& operator=(const RunningGauge&) = delete;

private:
    MetricsSink& metrics_;
};

} // namespace

Job jobFromMessage(const JobMessage& message) {
    Job job;
    job.id = message.jobId;
    job.status = Status::Pending;
    job.submittedAt = Clock::now();
    job.hashTypeId = message.hashTypeId;
    job.timeoutSeconds = message.timeoutSeconds;
    job.priority = message.priority;
    job.timeRemaining = message.timeoutSeconds;
    return job;
}

Pipeline::Pipeline(const Settings& settings, JobStore& store, MetricsSink& metrics, PhaseTable phases)
    : settings_(settings), store_(store), metrics_(metrics), phases_(std::move(phases)) {}

double Pipeline::elapsed(const Run& run) const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - run.start).count();
}

bool Pipeline::cancelled(const JobId& id) {
    auto current = store_.get(id);
    return current && current->status == Status::Cancelled;
}

void Pipeline::checkKill(const Run& run, const CancelToken* kill) const {
    if (kill && kill->cancelled()) {
        LOG_WARN("Job " + run.message.jobId + " exceeded its lane time limit");
        throw TimeLimitExceeded("Job " + run.message.jobId + " exceeded its lane time limit");
    }
}

Job Pipeline::persist(Run& run, const JobPatch& patch) {
    auto current = store_.get(run.message.jobId);
    Job next = merge(current ? *current : run.base, patch);
    store_.set(run.message.jobId, next, store_.defaultTtl());
    run.base = next;
    return next;
}

Job Pipeline::finish(Run& run, JobPatch patch) {
    patch.progress = 100;
    patch.timeRemaining = 0;
    patch.timeElapsed = elapsed(run);
    Job final = persist(run, patch);
    metrics_.jobFinished(final.status, final.timeElapsed);
    return final;
}

Job Pipeline::finishCancelled(Run& run, const std::string& reason) {
    LOG_INFO("Job " + run.message.jobId + " cancelled: " + reason);
    JobPatch patch;
    patch.status = Status::Cancelled;
    patch.attempts = run.attempts;
    patch.reason = reason;
    patch.lastPhase = run.lastPhase;
    return finish(run, patch);
}

Job Pipeline::finishSuccess(Run& run, int phase, const std::string& password) {
    JobPatch patch;
    patch.status = Status::Success;
    patch.result = password;
    patch.crackedInPhase = phase;
    patch.attempts = run.attempts;
    patch.lastPhase = phase;

    auto current = store_.get(run.message.jobId);
    if (current && current->status == Status::Cancelled) {
        // The user's cancel was recorded first; keep it and drop the result.
        LOG_INFO("Job " + run.message.jobId + " cracked in phase " + std::to_string(phase) +
                 " after cancellation; result discarded");
        patch.status.reset();
        patch.result.reset();
        patch.crackedInPhase.reset();
    } else {
        LOG_INFO("Job " + run.message.jobId + " cracked in phase " + std::to_string(phase) +
                 " after " + std::to_string(run.attempts) + " attempts");
    }
    return finish(run, patch);
}

Job Pipeline::finishFailed(Run& run, const std::string& reason) {
    JobPatch patch;
    patch.status = Status::Failed;
    patch.attempts = run.attempts;
    patch.reason = reason;
    patch.lastPhase = run.lastPhase;
    Job final = finish(run, patch);
    if (final.status == Status::Failed) {
        LOG_INFO("Job " + run.message.jobId + " failed: " + reason);
    }
    return final;
}

Job Pipeline::execute(const JobMessage& message, const CancelToken* kill) {
    Run run{message, jobFromMessage(message), std::chrono::steady_clock::now()};

    auto current = store_.get(message.jobId);
    if (!current) {
        LOG_WARN("No record for job " + message.jobId + ", recreating from message");
        store_.set(message.jobId, run.base, store_.defaultTtl());
        current = run.base;
    }
    run.base = *current;

    if (current->status == Status::Cancelled) {
        run.start = std::chrono::steady_clock::now();
        JobPatch patch;
        patch.attempts = 0;
        patch.reason = "Cancelled before processing";
        patch.progress = 100;
        patch.timeElapsed = 0.0;
        patch.timeRemaining = 0;
        Job final = persist(run, patch);
        LOG_INFO("Job " + message.jobId + " was cancelled before processing");
        metrics_.jobFinished(final.status, 0.0);
        return final;
    }
    if (current->status == Status::Success || current->status == Status::Failed) {
        LOG_INFO("Job " + message.jobId + " already " + toString(current->status) + ", skipping duplicate delivery");
        return *current;
    }

    const std::string& hash = message.targetHash;
    const int hashTypeId = current->hashTypeId;
    const double total = static_cast<double>(current->timeoutSeconds);

    LOG_INFO("Starting job " + message.jobId + " (mode " + std::to_string(hashTypeId) +
             ", timeout " + std::to_string(current->timeoutSeconds) + "s)");

    {
        JobPatch patch;
        patch.status = Status::Running;
        patch.startedAt = Clock::now();
        patch.progress = 0;
        patch.timeElapsed = 0.0;
        patch.timeRemaining = current->timeoutSeconds;
        patch.delivery = current->delivery + 1;
        persist(run, patch);
    }

    RunningGauge gauge(metrics_);

    try {
        for (int phase = 1; phase <= kPhaseCount; ++phase) {
            checkKill(run, kill);

            if (cancelled(message.jobId)) {
                return finishCancelled(run, "User requested cancellation");
            }

            const double spent = elapsed(run);
            if (spent >= total) {
                LOG_INFO("Job " + message.jobId + " out of time before phase " + std::to_string(phase));
                break;
            }
            const double budget = phaseBudget(settings_.ratios.forPhase(phase), total, spent);

            JobPatch progress;
            progress.progress = phaseMilestone(phase);
            progress.currentPhase = phaseLabel(phase);
            progress.phaseNumber = phase;
            progress.timeElapsed = spent;
            progress.timeRemaining = static_cast<int>(total - spent);
            if (!store_.update(message.jobId, progress)) {
                persist(run, progress);
            }

            const auto phaseStart = std::chrono::steady_clock::now();
            PhaseResult result = phases_[static_cast<std::size_t>(phase - 1)](hash, hashTypeId, budget);
            const double phaseSeconds =
                std::chrono::duration<double>(std::chrono::steady_clock::now() - phaseStart).count();

            run.attempts += result.attempts;
            run.lastPhase = phase;
            metrics_.phaseFinished(phaseName(phase), phaseSeconds, result.attempts);
            if (result.error) {
                LOG_WARN("Phase " + std::to_string(phase) + " reported: " + *result.error);
            }

            checkKill(run, kill);

            if (result.cracked && result.password) {
                return finishSuccess(run, phase, *result.password);
            }
        }

        run.lastPhase = kPhaseCount;
        return finishFailed(run, "Password not found after all phases");
    } catch (const InfrastructureError&) {
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR("Job " + message.jobId + " internal error: " + e.what());
        return finishFailed(run, std::string("Internal error: ") + e.what());
    }
}

} // namespace hashbreaker
