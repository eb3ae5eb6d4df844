#include <gtest/gtest.h>

#include "command/command.hpp"
#include "message.hpp"
#include "msgpack_codec.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

using namespace dtnclient;
using dtnclient::commands::UsageError;

namespace {

BundleContent stored_bundle(const std::string& id, const std::string& payload) {
    BundleContent content;
    content.bundle_id = id;
    content.source = Eid::dtn("node2", "out");
    content.destination = Eid::dtn("node1", "mailbox");
    content.payload.assign(payload.begin(), payload.end());
    return content;
}

std::string read_text(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace

class CommandTest : public ::testing::Test {
protected:
    void SetUp() override { codec::set_dump_directory(scratch_.path()); }
    void TearDown() override { codec::set_dump_directory({}); }

    std::string run(StubDaemon& daemon, const std::string& command, const std::vector<std::string>& args) {
        EXPECT_TRUE(daemon.start());
        Client client(unix_socket_factory(daemon.socket_path(), std::chrono::milliseconds(2000)));
        std::ostringstream out;
        commands::run_command(command, args, client, out);
        return out.str();
    }

    Message only_request(const StubDaemon& daemon) {
        auto requests = daemon.requests();
        EXPECT_EQ(requests.size(), 1u);
        return codec::decode(requests.at(0));
    }

    TempDir scratch_;
};

TEST_F(CommandTest, RegisterPrintsSuccess) {
    StubDaemon daemon([](const std::string&) { return frame_message(Response(MessageType::Response, "")); });

    EXPECT_EQ(run(daemon, "register", {"dtn://node1/mailbox"}), "success\n");
    EXPECT_EQ(message_type(only_request(daemon)), MessageType::RegisterEID);
}

TEST_F(CommandTest, RegisterWithUnregisterFlag) {
    StubDaemon daemon([](const std::string&) { return frame_message(Response(MessageType::Response, "")); });

    EXPECT_EQ(run(daemon, "register", {"-u", "dtn://node1/mailbox"}), "success\n");
    EXPECT_EQ(message_type(only_request(daemon)), MessageType::UnregisterEID);
}

TEST_F(CommandTest, ListPrintsOneIdPerLine) {
    StubDaemon daemon([](const std::string&) {
        return frame_message(ListResponse(MessageType::ListResponse, "", {"b1", "b2"}));
    });

    EXPECT_EQ(run(daemon, "list", {"--new", "dtn://node1/mailbox"}), "b1\nb2\n");
    auto request = std::get<ListBundles>(only_request(daemon));
    EXPECT_TRUE(request.new_only());
}

TEST_F(CommandTest, CreateBuildsBundleArguments) {
    StubDaemon daemon([](const std::string&) {
        return frame_message(BundleCreateResponse(MessageType::BundleCreateResponse, "", "dtn://node1/-1-0"));
    });

    std::string output = run(daemon, "create",
                             {"--destination", "dtn://node2/inbox", "--payload=hello", "--args-json",
                              R"({"lifetime": "1h", "hop_limit": 8})"});
    EXPECT_EQ(output, "dtn://node1/-1-0\n");

    auto request = std::get<BundleCreate>(only_request(daemon));
    const Mapping& args = request.args();
    ASSERT_NE(find(args, "destination"), nullptr);
    EXPECT_EQ(find(args, "destination")->as_string(), "dtn://node2/inbox");
    EXPECT_TRUE(find(args, "creation_timestamp_now")->as_bool());
    EXPECT_EQ(find(args, "lifetime")->as_string(), "1h");
    EXPECT_EQ(find(args, "hop_limit")->as_uint64(), 8u);
    EXPECT_EQ(find(args, "payload_block")->as_bytes(), (Bytes{'h', 'e', 'l', 'l', 'o'}));
    EXPECT_EQ(find(args, "source"), nullptr);
}

TEST_F(CommandTest, FetchWritesPayloadFile) {
    StubDaemon daemon([](const std::string&) {
        return frame_message(
            FetchBundleResponse(MessageType::FetchBundleResponse, "", stored_bundle("dtn://node2/-5-0", "data")));
    });

    std::filesystem::path out_dir = std::filesystem::path(scratch_.path()) / "out";
    std::string output =
        run(daemon, "fetch", {"--remove", "--output", out_dir.string(), "dtn://node1/mailbox", "dtn://node2/-5-0"});

    auto json = nlohmann::json::parse(output);
    EXPECT_EQ(json["bundle_id"], "dtn://node2/-5-0");
    EXPECT_EQ(json["source"], "dtn://node2/out");
    EXPECT_EQ(json["payload_size"], 4);

    std::filesystem::path payload_file = out_dir / "dtn___node2_-5-0";
    EXPECT_EQ(json["payload_file"], payload_file.string());
    EXPECT_EQ(read_text(payload_file), "data");

    auto request = std::get<FetchBundle>(only_request(daemon));
    EXPECT_TRUE(request.remove());
    EXPECT_EQ(request.bundle_id(), "dtn://node2/-5-0");
}

TEST_F(CommandTest, FetchAllPrintsEveryBundle) {
    StubDaemon daemon([](const std::string&) {
        return frame_message(FetchAllBundlesResponse(MessageType::FetchAllBundlesResponse, "",
                                                     {stored_bundle("b1", "x"), stored_bundle("b2", "yz")}));
    });

    std::istringstream lines(run(daemon, "fetch-all", {"dtn://node1/mailbox"}));
    std::vector<std::string> ids;
    for (std::string line; std::getline(lines, line);) {
        ids.push_back(nlohmann::json::parse(line)["bundle_id"].get<std::string>());
    }
    EXPECT_EQ(ids, (std::vector<std::string>{"b1", "b2"}));
}

TEST_F(CommandTest, UsageErrorsDoNotContactDaemon) {
    StubDaemon daemon([](const std::string&) { return frame_message(Response(MessageType::Response, "")); });

    EXPECT_THROW(run(daemon, "bogus", {}), UsageError);
    EXPECT_THROW(run(daemon, "register", {}), UsageError);
    EXPECT_THROW(run(daemon, "register", {"dtn://none"}), UsageError);
    EXPECT_THROW(run(daemon, "create", {"--payload", "x"}), UsageError);
    EXPECT_THROW(run(daemon, "create", {"--destination", "dtn://n/m", "--payload", "x", "--payload-file", "f"}),
                 UsageError);
    EXPECT_THROW(run(daemon, "create", {"--destination", "dtn://n/m", "--args-json", "[1]"}), UsageError);
    EXPECT_TRUE(daemon.requests().empty());
}

TEST(CommandUsage, ListsEveryCommand) {
    std::ostringstream out;
    commands::print_command_usage(out);
    for (const char* name : {"register", "unregister", "create", "list", "fetch", "fetch-all"}) {
        EXPECT_NE(out.str().find(std::string("  ") + name), std::string::npos) << name;
    }
}

TEST(CommandJson, JsonLibrarySupportsBinaryValues) {
    static_assert(NLOHMANN_JSON_VERSION_MAJOR > 3 ||
                      (NLOHMANN_JSON_VERSION_MAJOR == 3 && NLOHMANN_JSON_VERSION_MINOR >= 8),
                  "nlohmann_json 3.8 or newer is required for binary values");

    nlohmann::json json = nlohmann::json::binary({0x00, 0xFF});
    EXPECT_EQ(json.type(), nlohmann::json::value_t::binary);
    EXPECT_EQ(json.get_binary().size(), 2u);
}
