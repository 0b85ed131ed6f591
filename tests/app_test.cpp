#include "mdns_scan/app.hpp"

#include <memory>

#include <gtest/gtest.h>

#include "fake_discovery.hpp"

using namespace mdns_scan;
using namespace mdns_scan::test;

namespace
{

class AppTest : public ::testing::Test
{
protected:
    AppTest()
    {
        settings.poll_interval = std::chrono::milliseconds(5);
        controller = std::make_unique<ScanController>(store, backend, settings);
    }

    void Type(App& app, const std::string& text)
    {
        for (const char c : text) {
            app.Handle(AppendChar{c});
        }
    }

    ScanSettings settings;
    std::shared_ptr<FakeDiscoveryBackend> backend{std::make_shared<FakeDiscoveryBackend>()};
    std::shared_ptr<RecordStore> store{std::make_shared<RecordStore>()};
    std::unique_ptr<ScanController> controller;
};

}

TEST_F(AppTest, StartsEditingWithoutQuery)
{
    App app(*controller);

    EXPECT_EQ(app.Mode(), AppMode::Editing);
    EXPECT_EQ(app.Query(), "");
    EXPECT_FALSE(controller->Scanning());
    EXPECT_TRUE(backend->Opened().empty());
}

TEST_F(AppTest, StartsViewingAndScanningWithQuery)
{
    App app(*controller, std::string("_http._tcp.local"));

    EXPECT_EQ(app.Mode(), AppMode::Viewing);
    EXPECT_EQ(app.Query(), "_http._tcp.local");
    EXPECT_TRUE(controller->Scanning());
    EXPECT_EQ(backend->Opened(), std::vector<std::string>{"_http._tcp.local"});
}

TEST_F(AppTest, EditAndCommitRestartsScan)
{
    App app(*controller, std::string("_http._tcp.local"));

    app.Handle(EnterEdit{});
    EXPECT_TRUE(app.Editing());
    EXPECT_EQ(app.QueryLine(), "_http._tcp.local_");

    for (int i = 0; i < 10; ++i) {
        app.Handle(DeleteChar{});
    }
    EXPECT_EQ(app.Query(), "_http.");
    Type(app, "_ipp._tcp.local");
    EXPECT_EQ(app.Query(), "_http._ipp._tcp.local");

    app.Handle(Commit{});
    EXPECT_EQ(app.Mode(), AppMode::Viewing);
    EXPECT_EQ(app.QueryLine(), "_http._ipp._tcp.local");
    EXPECT_EQ(controller->ActiveQuery(), std::optional<std::string>("_http._ipp._tcp.local"));
    EXPECT_EQ(backend->Closed(), std::vector<std::string>{"_http._tcp.local"});
}

TEST_F(AppTest, DeleteOnEmptyQueryIsHarmless)
{
    App app(*controller);
    app.Handle(DeleteChar{});
    EXPECT_EQ(app.Query(), "");
    EXPECT_TRUE(app.Editing());
}

TEST_F(AppTest, EventsOutsideTheirModeAreIgnored)
{
    App app(*controller, std::string("_http._tcp.local"));

    app.Handle(AppendChar{'x'});
    app.Handle(DeleteChar{});
    app.Handle(Commit{});
    EXPECT_EQ(app.Mode(), AppMode::Viewing);
    EXPECT_EQ(app.Query(), "_http._tcp.local");
    EXPECT_EQ(backend->Opened().size(), 1u);

    app.Handle(EnterEdit{});
    app.Handle(Quit{});
    app.Handle(EnterEdit{});
    EXPECT_EQ(app.Mode(), AppMode::Editing);
    EXPECT_TRUE(controller->Scanning());
}

TEST_F(AppTest, QuitShutsDownScan)
{
    App app(*controller, std::string("_http._tcp.local"));
    app.Handle(Quit{});

    EXPECT_TRUE(app.Exited());
    EXPECT_FALSE(controller->Scanning());
    EXPECT_EQ(backend->Live(), 0);

    // Exited is terminal
    app.Handle(EnterEdit{});
    EXPECT_TRUE(app.Exited());
}

TEST_F(AppTest, FailedCommitKeepsErrorUntilNextSuccess)
{
    backend->FailOpen("bad");
    App app(*controller);
    Type(app, "bad");
    app.Handle(Commit{});

    EXPECT_EQ(app.Mode(), AppMode::Viewing);
    EXPECT_FALSE(app.LastError().empty());
    EXPECT_FALSE(controller->Scanning());

    app.Handle(EnterEdit{});
    app.Handle(DeleteChar{});
    app.Handle(DeleteChar{});
    app.Handle(DeleteChar{});
    Type(app, "_ipp._tcp.local");
    app.Handle(Commit{});

    EXPECT_TRUE(app.LastError().empty());
    EXPECT_TRUE(controller->Scanning());
}

TEST_F(AppTest, CommitClearsPreviousResults)
{
    App app(*controller, std::string("_http._tcp.local"));
    Response response;
    response.AddRecord(MakeA("web.local.", "10.0.0.2"));
    backend->Push("_http._tcp.local", response);
    ASSERT_TRUE(WaitFor([this]() { return store->Size() == 1; }));

    app.Handle(EnterEdit{});
    app.Handle(Commit{});

    EXPECT_TRUE(store->Snapshot().Empty());
    EXPECT_EQ(backend->Opened().size(), 2u);
}

TEST_F(AppTest, OnlyPrintableAsciiIsTyped)
{
    App app(*controller);
    Type(app, "_h\xc3\xa9ttp\t\x7f");
    EXPECT_EQ(app.Query(), "_http");

    app.Handle(DeleteChar{});
    EXPECT_EQ(app.Query(), "_htt");
}
