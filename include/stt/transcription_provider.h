#pragma once

/**
 * @file transcription_provider.h
 * @brief Speech-to-text backend family
 */

#include "backend/backend_provider.h"
#include "backend/backend_registry.h"
#include "common.h"
#include "errors.h"
#include <string>

namespace conductor {
namespace stt {

struct TranscriptionRequest {
    AudioClip audio;
    std::string language;  ///< Empty = provider default
};

struct TranscriptionResult {
    std::string text;
    std::string backend;   ///< Provider id that produced it
    std::string model;
};

/**
 * @brief Transcription provider: readiness contract plus transcribe()
 */
class TranscriptionProvider : public BackendProvider {
public:
    /**
     * @brief Transcribe one clip
     * @return EmptyInput when nothing intelligible was heard
     */
    virtual Result<TranscriptionResult> transcribe(const TranscriptionRequest& request) = 0;
};

} // namespace stt

using TranscriptionRegistry = BackendRegistry<stt::TranscriptionProvider>;

} // namespace conductor
