// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file reporting.hpp
 * @brief Progress, warning and message sink for the loading pipeline
 * @details IReporting is the notification channel used by every pipeline
 *          stage. Calls are synchronous and made on the loading thread;
 *          implementations must return promptly. LoggingReporting is the
 *          default implementation and forwards everything to an spdlog
 *          logger created through LoggerFactory.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace dicom_stacker::core {

/**
 * @brief Interface for progress and user notifications
 *
 * Warnings and messages are additive notifications; none of them aborts the
 * pipeline. Identifiers have the form "operation:Reason", e.g.
 * "loadMetadataFromDicomFiles:NotADicomFile".
 */
class IReporting {
public:
    virtual ~IReporting() = default;

    /// Start a progress phase with a user-visible label
    virtual void showProgress(const std::string& label) = 0;

    /// Update the current phase, 0..100
    virtual void updateProgress(int percent) = 0;

    /// Mark the current phase as finished
    virtual void completeProgress() = 0;

    virtual void showWarning(const std::string& identifier, const std::string& text) = 0;

    /// Informational notice that is not a warning
    virtual void showMessage(const std::string& identifier, const std::string& text) = 0;
};

/**
 * @brief Reporting sink that writes to the application log
 *
 * Warnings are logged at warn level, messages and phase labels at info,
 * progress percentages at debug (only when the value changes).
 */
class LoggingReporting : public IReporting {
public:
    explicit LoggingReporting(const std::string& loggerName = "dicom_stacker");
    ~LoggingReporting() override;

    void showProgress(const std::string& label) override;
    void updateProgress(int percent) override;
    void completeProgress() override;
    void showWarning(const std::string& identifier, const std::string& text) override;
    void showMessage(const std::string& identifier, const std::string& text) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
    std::string currentLabel_;
    int lastPercent_ = -1;
};

}  // namespace dicom_stacker::core
