#include <gtest/gtest.h>
#include "upload/Orchestrator.hpp"
#include "upload/Registry.hpp"
#include "notify/Dispatcher.hpp"
#include "settings/Preferences.hpp"
#include "fakes.hpp"

#include <system_error>

using namespace fdrop;
using namespace fdrop::upload;
using namespace fdrop::types;
using namespace std::chrono_literals;

class OrchestratorTest : public ::testing::Test {
protected:
    test::TempDir dir{"fastdrop_orchestrator"};

    std::shared_ptr<Registry> registry = std::make_shared<Registry>();
    std::shared_ptr<test::StubProviderFactory> providers = std::make_shared<test::StubProviderFactory>();
    std::shared_ptr<test::MemoryStateStore> state = std::make_shared<test::MemoryStateStore>();
    std::shared_ptr<settings::Preferences> prefs =
        std::make_shared<settings::Preferences>(state, ProviderKind::AnonymousHost);
    std::shared_ptr<test::CallLog> log = std::make_shared<test::CallLog>();
    std::shared_ptr<notify::Dispatcher> dispatcher = std::make_shared<notify::Dispatcher>(
        std::make_shared<test::RecordingClipboard>(log), std::make_shared<test::RecordingNotifier>(log), prefs);

    std::unique_ptr<Orchestrator> orchestrator =
        std::make_unique<Orchestrator>(registry, providers, prefs, dispatcher, ProgressSettings{2ms, 10, 90});

    void TearDown() override { orchestrator.reset(); }

    EntryId submit(const std::string& name, const std::string& content = "0123456789") {
        return registry->add(dir.writeFile(name, content).string());
    }

    void useProvider(const ProviderKind kind, test::ScriptedProvider::Behaviour behaviour) const {
        providers->set(kind, std::make_shared<test::ScriptedProvider>(kind, std::move(behaviour)));
    }
};

TEST_F(OrchestratorTest, SuccessfulUploadEndsInSuccessWithUrl) {
    useProvider(ProviderKind::AnonymousHost, [](const std::vector<uint8_t>& bytes, const std::string& name) {
        return "https://0x0.st/" + std::to_string(bytes.size()) + "/" + name;
    });
    const auto id = submit("digits.txt");

    const auto outcome = orchestrator->begin(id).get();

    EXPECT_TRUE(outcome.ok);
    EXPECT_EQ(outcome.url, "https://0x0.st/10/digits.txt");

    const auto e = registry->get(id);
    EXPECT_EQ(e->state, UploadState::Success);
    EXPECT_EQ(e->progress, 100u);
    EXPECT_EQ(e->resultUrl.value_or(""), outcome.url);
    EXPECT_EQ(e->provider, ProviderKind::AnonymousHost);
}

TEST_F(OrchestratorTest, ProviderErrorEndsInErrorWithKindPrefix) {
    useProvider(ProviderKind::AnonymousHost, [](const std::vector<uint8_t>&, const std::string&) -> std::string {
        throw UploadError(UploadError::Kind::Network, "Upload to 0x0.st failed: HTTP 500 - oops");
    });
    const auto id = submit("a.bin");

    const auto outcome = orchestrator->begin(id).get();

    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.errorKind, UploadError::Kind::Network);

    const auto e = registry->get(id);
    EXPECT_EQ(e->state, UploadState::Error);
    EXPECT_EQ(e->progress, 0u);
    EXPECT_EQ(e->errorMessage.value_or(""), "Network error: Upload to 0x0.st failed: HTTP 500 - oops");
    EXPECT_TRUE(log->snapshot().empty());
}

TEST_F(OrchestratorTest, UnexpectedExceptionBecomesUnknownError) {
    useProvider(ProviderKind::AnonymousHost, [](const std::vector<uint8_t>&, const std::string&) -> std::string {
        throw std::runtime_error("bad_alloc in disguise");
    });
    const auto id = submit("a.bin");

    const auto outcome = orchestrator->begin(id).get();

    EXPECT_EQ(outcome.errorKind, UploadError::Kind::Unknown);
    const auto msg = registry->get(id)->errorMessage.value_or("");
    EXPECT_EQ(msg.rfind("Unknown error: ", 0), 0u);
    EXPECT_NE(msg.find("bad_alloc in disguise"), std::string::npos);
}

TEST_F(OrchestratorTest, UnreadableFileBecomesUnknownErrorWithoutProvider) {
    useProvider(ProviderKind::AnonymousHost, [](const std::vector<uint8_t>&, const std::string&) {
        return std::string("https://never");
    });
    const auto id = registry->add((dir.path() / "does-not-exist.bin").string());

    const auto outcome = orchestrator->begin(id).get();

    EXPECT_EQ(outcome.errorKind, UploadError::Kind::Unknown);
    EXPECT_EQ(registry->get(id)->state, UploadState::Error);
    EXPECT_EQ(providers->createdCount(ProviderKind::AnonymousHost), 0u);
}

TEST_F(OrchestratorTest, UsesProviderSelectedAtBegin) {
    useProvider(ProviderKind::CredentialedCloudStore, [](const std::vector<uint8_t>&, const std::string&) {
        return std::string("https://drive.google.com/file/d/X/view");
    });
    prefs->setSelectedProvider(ProviderKind::CredentialedCloudStore);
    const auto id = submit("a.bin");

    const auto outcome = orchestrator->begin(id).get();

    EXPECT_TRUE(outcome.ok);
    EXPECT_EQ(providers->createdCount(ProviderKind::CredentialedCloudStore), 1u);
    EXPECT_EQ(registry->get(id)->provider, ProviderKind::CredentialedCloudStore);
}

TEST_F(OrchestratorTest, BeginRequiresIdleEntry) {
    const auto gated = std::make_shared<test::GatedProvider>("https://0x0.st/g");
    providers->set(ProviderKind::AnonymousHost, gated);
    const auto id = submit("a.bin");

    auto future = orchestrator->begin(id);
    EXPECT_THROW(orchestrator->begin(id), std::logic_error);

    gated->release();
    EXPECT_TRUE(future.get().ok);
    EXPECT_THROW(orchestrator->begin(id), std::logic_error);

    Registry other;
    EXPECT_THROW(orchestrator->begin(other.add("/tmp/x")), std::out_of_range);
}

TEST_F(OrchestratorTest, ProgressStaysBelowCapUntilCompletion) {
    const auto gated = std::make_shared<test::GatedProvider>("https://0x0.st/g");
    providers->set(ProviderKind::AnonymousHost, gated);
    const auto id = submit("a.bin");

    std::mutex m;
    std::vector<std::pair<UploadState, unsigned int>> seen;
    registry->subscribe([&](EntryEvent, const UploadEntry& e) {
        std::scoped_lock lock(m);
        seen.emplace_back(e.state, e.progress);
    });

    auto future = orchestrator->begin(id);
    gated->waitUntilEntered();
    ASSERT_TRUE(test::waitFor([&] { return registry->get(id)->progress == 90; }));
    gated->release();
    future.get();

    std::scoped_lock lock(m);
    ASSERT_GE(seen.size(), 3u);
    unsigned int last = 0;
    for (const auto& [st, p] : seen) {
        if (st == UploadState::Uploading) {
            EXPECT_LE(p, 90u);
            EXPECT_GE(p, last);
            last = p;
        }
    }
    EXPECT_EQ(seen.back(), std::make_pair(UploadState::Success, 100u));
}

TEST_F(OrchestratorTest, RemovalDuringFlightMakesCompletionANoOp) {
    prefs->setAutoCopy(true);
    const auto gated = std::make_shared<test::GatedProvider>("https://0x0.st/late");
    providers->set(ProviderKind::AnonymousHost, gated);
    const auto id = submit("a.bin");

    auto future = orchestrator->begin(id);
    gated->waitUntilEntered();
    ASSERT_TRUE(registry->remove(id));

    gated->release();
    EXPECT_NO_THROW(future.get());

    EXPECT_FALSE(registry->get(id).has_value());
    EXPECT_EQ(registry->size(), 0u);
    EXPECT_TRUE(log->snapshot().empty());
}

TEST_F(OrchestratorTest, AutoCopyCopiesExactUrlOnceBeforeNotification) {
    prefs->setAutoCopy(true);
    useProvider(ProviderKind::AnonymousHost, [](const std::vector<uint8_t>&, const std::string&) {
        return std::string("https://0x0.st/abc.txt");
    });
    const auto id = submit("digits.txt");

    orchestrator->begin(id).get();

    const auto calls = log->snapshot();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], "clipboard:https://0x0.st/abc.txt");
    EXPECT_EQ(calls[1].rfind("notify:", 0), 0u);
}

TEST_F(OrchestratorTest, ConcurrentUploadsCompleteIndependently) {
    useProvider(ProviderKind::AnonymousHost, [](const std::vector<uint8_t>&, const std::string& name) {
        std::this_thread::sleep_for(name == "slow.bin" ? 30ms : 1ms);
        return "https://0x0.st/" + name;
    });

    const auto slow = submit("slow.bin");
    const auto fast = submit("fast.bin");
    auto slowFuture = orchestrator->begin(slow);
    auto fastFuture = orchestrator->begin(fast);

    EXPECT_EQ(fastFuture.get().url, "https://0x0.st/fast.bin");
    EXPECT_EQ(slowFuture.get().url, "https://0x0.st/slow.bin");

    orchestrator->waitAll();
    EXPECT_EQ(orchestrator->inFlight(), 0u);
    EXPECT_EQ(registry->get(slow)->state, UploadState::Success);
    EXPECT_EQ(registry->get(fast)->state, UploadState::Success);
}

namespace {

class ThreadlessOrchestrator final : public Orchestrator {
public:
    using Orchestrator::Orchestrator;

protected:
    std::thread launch(std::function<void()>) override {
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
    }
};

}

TEST_F(OrchestratorTest, WorkerThatCannotStartEndsEntryInError) {
    useProvider(ProviderKind::AnonymousHost, [](const std::vector<uint8_t>&, const std::string&) {
        return std::string("https://never");
    });
    ThreadlessOrchestrator threadless(registry, providers, prefs, dispatcher, ProgressSettings{2ms, 10, 90});
    const auto id = submit("a.bin");

    auto future = threadless.begin(id);
    ASSERT_EQ(future.wait_for(0s), std::future_status::ready);

    const auto outcome = future.get();
    EXPECT_FALSE(outcome.ok);
    EXPECT_EQ(outcome.errorKind, UploadError::Kind::Unknown);

    const auto e = registry->get(id);
    EXPECT_EQ(e->state, UploadState::Error);
    EXPECT_EQ(e->errorMessage.value_or("").rfind("Unknown error: Could not start upload worker: ", 0), 0u);
    EXPECT_EQ(providers->createdCount(ProviderKind::AnonymousHost), 0u);
    EXPECT_EQ(threadless.inFlight(), 0u);
    EXPECT_TRUE(log->snapshot().empty());
}
