#pragma once

#include "turn.h"
#include "errors.h"
#include <string>
#include <vector>

namespace conductor {

/**
 * @brief Everything the reasoning backend gets to produce the next Turn
 */
struct ReasoningContext {
    std::string agent_name;
    std::string input;            ///< The request being worked on
    std::string observation;      ///< Latest observation (request text on the first iteration)
    std::vector<Turn> trace;      ///< Completed Turns so far, oldest first
    std::string catalogue;        ///< Delegate catalogue text (empty = no delegates)
    std::vector<std::string> media;  ///< Image references attached to the request
    int iteration = 1;            ///< 1-based index of the Turn being requested
    int max_iterations = 1;

    int remaining() const { return max_iterations - iteration + 1; }
};

/**
 * @brief Language-model collaborator contract
 *
 * Returns one structured Turn or fails. Malformed output must come back as
 * ErrorType::MalformedTurn, never as an exception. Implementations must be
 * safe to call from the queue worker thread and from sub-agent threads.
 */
class ReasoningBackend {
public:
    virtual ~ReasoningBackend() = default;

    virtual Result<Turn> complete(const ReasoningContext& context) = 0;
};

} // namespace conductor
