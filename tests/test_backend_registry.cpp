/**
 * Provider registry lifecycle: registration, concurrent preparation,
 * fallback, blocking selection, health caching and re-initialization.
 *
 * Run from build dir: ./test_backend_registry
 */

#include "test_support.h"
#include "backend/backend_registry.h"
#include "stt/transcription_provider.h"
#include <memory>

using namespace conductor;
using test_support::FakeTranscriber;

int main() {
    Logger::initialize(LogLevel::WARN);

    // --- registration ---
    {
        TranscriptionRegistry registry("transcription");
        ASSERT(registry.current() == nullptr);
        ASSERT(registry.register_provider(std::make_shared<FakeTranscriber>("alpha")).is_ok());
        ASSERT(registry.register_provider(std::make_shared<FakeTranscriber>("beta")).is_ok());

        auto dup = registry.register_provider(std::make_shared<FakeTranscriber>("alpha", "impostor"));
        ASSERT(dup.is_error());
        ASSERT(dup.error().type == ErrorType::DuplicateBackend);
        ASSERT(registry.size() == 2);

        // First registration is the initial selection
        ASSERT(registry.selected_id() == "alpha");
        ASSERT(registry.state("alpha") == BackendState::Registered);
        ASSERT(registry.state("gamma") == BackendState::Unregistered);

        auto unknown = registry.set_preferred("gamma");
        ASSERT(unknown.is_error() && unknown.error().type == ErrorType::UnknownBackend);
        ASSERT(registry.set_preferred("beta").is_ok());
        ASSERT(registry.selected_id() == "beta");

        auto unknown_select = registry.select("gamma");
        ASSERT(unknown_select.is_error() && unknown_select.error().type == ErrorType::UnknownBackend);
        ASSERT(unknown_select.error().message.find("alpha") != std::string::npos);
    }

    // --- failed preferred provider falls back to the first ready one ---
    {
        TranscriptionRegistry registry("transcription");
        auto broken = std::make_shared<FakeTranscriber>("broken");
        broken->prepare_error = "model file missing";
        broken->healthy = false;
        auto slow = std::make_shared<FakeTranscriber>("slow");
        slow->prepare_delay_ms = 100;
        auto fast = std::make_shared<FakeTranscriber>("fast");

        registry.register_provider(broken);
        registry.register_provider(slow);
        registry.register_provider(fast);
        registry.set_preferred("broken");

        registry.initialize_all().wait();
        ASSERT(registry.state("broken") == BackendState::Failed);
        ASSERT(registry.state("slow") == BackendState::Ready);
        ASSERT(registry.state("fast") == BackendState::Ready);
        ASSERT(registry.selected_id() == "slow");
        ASSERT(registry.current() == slow);

        auto reason = registry.failure_reason("broken");
        ASSERT(reason.has_value() && reason->find("model file missing") != std::string::npos);

        // Failed provider carries remediation text in the listing
        bool found = false;
        for (const auto& status : registry.list()) {
            if (status.id == "broken") {
                found = true;
                ASSERT(!status.ready());
                ASSERT(status.remediation == "start the fake service");
                ASSERT(!status.selected);
            }
        }
        ASSERT(found);

        // Selecting the failed provider is refused and leaves the selection alone
        auto refused = registry.select("broken");
        ASSERT(refused.is_error());
        ASSERT(refused.error().type == ErrorType::BackendNotReady);
        ASSERT(registry.selected_id() == "slow");

        ASSERT(registry.select("fast").is_ok());
        ASSERT(registry.current() == fast);

        // Each provider was prepared exactly once
        ASSERT(broken->prepare_calls == 1);
        ASSERT(slow->prepare_calls == 1);
        ASSERT(fast->prepare_calls == 1);
    }

    // --- every provider failing leaves the selection in place with a reason ---
    {
        TranscriptionRegistry registry("transcription");
        auto a = std::make_shared<FakeTranscriber>("a");
        a->prepare_error = "no network";
        registry.register_provider(a);
        registry.initialize_all().wait();
        ASSERT(registry.selected_id() == "a");
        ASSERT(registry.state("a") == BackendState::Failed);
        ASSERT(registry.failure_reason("a").has_value());
    }

    // --- select blocks on a provider that is still initializing ---
    {
        TranscriptionRegistry registry("transcription");
        auto first = std::make_shared<FakeTranscriber>("first");
        auto lazy = std::make_shared<FakeTranscriber>("lazy");
        lazy->prepare_delay_ms = 150;
        registry.register_provider(first);
        registry.register_provider(lazy);

        // Never initialized: select starts preparation and waits for it
        TimePoint started = Clock::now();
        ASSERT(registry.select("lazy").is_ok());
        ASSERT(ms_since(started) >= 100);
        ASSERT(registry.state("lazy") == BackendState::Ready);
        ASSERT(registry.selected_id() == "lazy");
        ASSERT(lazy->prepare_calls == 1);

        // Bounded wait gives up with Timeout and keeps the selection
        auto sluggish = std::make_shared<FakeTranscriber>("sluggish");
        sluggish->prepare_delay_ms = 300;
        registry.register_provider(sluggish);
        auto timed_out = registry.select("sluggish", 50);
        ASSERT(timed_out.is_error());
        ASSERT(timed_out.error().type == ErrorType::Timeout);
        ASSERT(registry.selected_id() == "lazy");
        ASSERT(registry.wait_until_resolved("sluggish", 2000) == BackendState::Ready);
        ASSERT(registry.select("sluggish").is_ok());
        ASSERT(sluggish->prepare_calls == 1);
    }

    // --- current() hands out a provider that survives a swap ---
    {
        TranscriptionRegistry registry("transcription");
        auto one = std::make_shared<FakeTranscriber>("one", "from one");
        auto two = std::make_shared<FakeTranscriber>("two", "from two");
        registry.register_provider(one);
        registry.register_provider(two);
        registry.initialize_all().wait();

        std::shared_ptr<stt::TranscriptionProvider> captured = registry.current();
        ASSERT(registry.select("two").is_ok());
        stt::TranscriptionRequest request;
        request.audio.bytes = {1, 2, 3};
        auto r = captured->transcribe(request);
        ASSERT(r.is_ok() && r.value().backend == "one");
        ASSERT(registry.current()->id() == "two");
    }

    // --- health probes: cached for the TTL, degraded and recovered ---
    {
        TranscriptionRegistry::Options options;
        options.health_ttl_ms = 200;
        TranscriptionRegistry registry("transcription", options);
        auto svc = std::make_shared<FakeTranscriber>("svc");
        registry.register_provider(svc);
        registry.initialize_all().wait();

        auto first = registry.health();
        ASSERT(first.size() == 1);
        ASSERT(first[0].state == BackendState::Ready);
        ASSERT(!first[0].checked_at.empty());
        int probes = svc->health_calls;
        ASSERT(probes == 1);

        // Within the TTL the cached probe is reused
        registry.health();
        ASSERT(svc->health_calls == probes);

        svc->healthy = false;
        test_support::sleep_ms(250);
        auto degraded = registry.health();
        ASSERT(degraded[0].state == BackendState::Degraded);
        ASSERT(degraded[0].reason == "service unreachable");
        ASSERT(registry.failure_reason("svc").value_or("") == "service unreachable");

        // Degraded stays selectable
        ASSERT(registry.select("svc").is_ok());

        svc->healthy = true;
        test_support::sleep_ms(250);
        auto recovered = registry.health();
        ASSERT(recovered[0].state == BackendState::Ready);
        ASSERT(svc->prepare_calls == 1);

        nlohmann::json j = recovered[0].to_json();
        ASSERT(j["state"] == "ready");
        ASSERT(j["selected"] == true);
    }

    // --- re-initialization after a failure ---
    {
        TranscriptionRegistry registry("transcription");
        auto flaky = std::make_shared<FakeTranscriber>("flaky");
        flaky->prepare_error = "download interrupted";
        registry.register_provider(flaky);
        registry.initialize_all().wait();
        ASSERT(registry.state("flaky") == BackendState::Failed);

        flaky->prepare_error.clear();
        ASSERT(registry.reinitialize("flaky").is_ok());
        ASSERT(registry.wait_until_resolved("flaky", 2000) == BackendState::Ready);
        ASSERT(flaky->prepare_calls == 2);

        // Already prepared: no further preparation
        ASSERT(registry.reinitialize("flaky").is_ok());
        ASSERT(registry.state("flaky") == BackendState::Ready);
        ASSERT(flaky->prepare_calls == 2);

        auto unknown = registry.reinitialize("nope");
        ASSERT(unknown.is_error() && unknown.error().type == ErrorType::UnknownBackend);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed\n";
        return 1;
    }
    std::cout << "All backend registry tests passed.\n";
    return 0;
}
