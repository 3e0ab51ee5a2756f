/**
 * @file StageTracker.hpp
 * @brief Per-scope pipeline stage and output file tracking
 *
 * Each scope worker owns one tracker. Stages must run in pipeline order
 * (Load, Rasterize, Distance, Classify, Aggregate, Emit); a stage may be
 * skipped but never revisited.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "Logger.hpp"
#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

namespace popaccess {

enum class PipelineStage {
    LOAD,
    RASTERIZE,
    DISTANCE,
    CLASSIFY,
    AGGREGATE,
    EMIT
};

const char* to_string(PipelineStage stage);

/**
 * @brief Timing and outcome of one stage
 */
struct StageRecord {
    PipelineStage stage;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
    bool completed = false;
    bool successful = false;
    std::string error_message;
    std::unordered_map<std::string, std::string> stage_data;

    explicit StageRecord(PipelineStage s)
        : stage(s), start_time(std::chrono::steady_clock::now()) {}

    void complete(bool success = true, const std::string& error = "") {
        end_time = std::chrono::steady_clock::now();
        completed = true;
        successful = success;
        error_message = error;
    }

    std::chrono::milliseconds duration() const {
        if (!completed) return std::chrono::milliseconds(0);
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    }
};

/**
 * @brief Information about a written output file
 */
struct OutputFileInfo {
    std::string filename;
    std::string format;
    size_t file_size_bytes = 0;
    bool written = false;
};

class StageTracker {
public:
    explicit StageTracker(std::string scope_name);

    /**
     * @brief Open a stage
     * @throws std::logic_error if a stage is still open or the stage does not follow the last one
     */
    void startStage(PipelineStage stage);

    /**
     * @throws std::logic_error if the stage is not the open one
     */
    void completeStage(PipelineStage stage, bool successful = true, const std::string& error = "");

    /// Close the open stage as failed, if any
    void failOpenStage(const std::string& error);

    void addStageData(PipelineStage stage, const std::string& key, const std::string& value);

    void trackOutputFile(const std::string& filename, const std::string& format);

    const std::string& scopeName() const { return scope_name_; }
    const std::vector<StageRecord>& stages() const { return stages_; }
    const std::vector<OutputFileInfo>& outputFiles() const { return output_files_; }
    size_t getCompletedStageCount() const;
    std::chrono::milliseconds totalDuration() const;

    std::string getPipelineStatus() const;
    std::string getTimingReport() const;

    /// Log the per-stage timings at DETAILED level
    void logSummary() const;

private:
    std::string scope_name_;
    std::vector<StageRecord> stages_;
    std::vector<OutputFileInfo> output_files_;
    Logger logger_;

    StageRecord* findStage(PipelineStage stage);
    static std::string formatDuration(std::chrono::milliseconds duration);
};

} // namespace popaccess
