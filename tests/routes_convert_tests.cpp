// tests/routes_convert_tests.cpp
// -----------------------------------------------------------------------------
// POST /api/convert.
//   * Handler-level tests drive handle_convert() directly with a FakeConverter
//     that can succeed, fail, time out, throw or misbehave on demand.
//   * One end-to-end test runs the real server on an ephemeral port with a
//     shell script standing in for pandoc.
// After every request the scratch directory must be empty again.
// -----------------------------------------------------------------------------

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <set>

#include "routes.h"
#include "test_helpers.h"

using namespace std::chrono_literals;

namespace {

const string kDocxBytes = string("PK\x03\x04", 4) + "fake-docx-payload";

class FakeConverter : public Converter {
public:
    enum class Mode {
        WriteDocx,      // exit 0, writes kDocxBytes
        EchoInput,      // exit 0, output = input bytes
        FailExit,       // exit 1 with stderr
        NoOutput,       // exit 0, writes nothing
        EmptyOutput,    // exit 0, zero-byte output
        OutputIsDir,    // exit 0, output path is a directory
        Timeout,        // reports timed_out
        Throw           // throws from inside the conversion
    };

    explicit FakeConverter(Mode mode) : mode_(mode) {}

    ProcessResult run(const string& input_path, const string& output_path,
                      std::chrono::seconds timeout) override {
        ++calls;
        {
            std::lock_guard<std::mutex> lock(mu);
            input_paths.push_back(input_path);
            output_paths.push_back(output_path);
            inputs.push_back(read_file_binary(input_path));
            last_timeout = timeout;
        }

        ProcessResult r;
        r.exit_code = 0;

        switch (mode_) {
        case Mode::WriteDocx:
            write_file_binary(output_path, kDocxBytes);
            break;
        case Mode::EchoInput:
            write_file_binary(output_path, read_file_binary(input_path));
            break;
        case Mode::FailExit:
            r.exit_code = 1;
            r.stderr_text = stderr_text;
            break;
        case Mode::NoOutput:
            break;
        case Mode::EmptyOutput:
            ofstream(output_path, std::ios::binary).close();
            break;
        case Mode::OutputIsDir:
            fs::create_directory(output_path);
            break;
        case Mode::Timeout:
            // A partial output left behind by a killed converter.
            write_file_binary(output_path, "partial");
            r.exit_code = 137;
            r.timed_out = true;
            break;
        case Mode::Throw:
            write_file_binary(output_path, "half-written");
            throw std::runtime_error("converter exploded");
        }

        return r;
    }

    std::atomic<int> calls{0};
    std::mutex mu;
    vector<string> input_paths;
    vector<string> output_paths;
    vector<string> inputs;
    std::chrono::seconds last_timeout{0};
    string stderr_text = "pandoc: Unknown extension: foo\n";

private:
    Mode mode_;
};

class ConvertRouteTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg.scratch_dir = scratch.str();
        cfg.convert_timeout = std::chrono::seconds(30);
    }

    httplib::Response post(Converter& conv, const string& body,
                           const string& content_type = "application/json") {
        httplib::Request req;
        req.method = "POST";
        req.path = "/api/convert";
        req.remote_addr = "203.0.113.7";
        if (!content_type.empty()) req.headers.emplace("Content-Type", content_type);
        req.body = body;

        httplib::Response res;
        handle_convert(req, res, cfg, conv);
        return res;
    }

    static json body_json(const httplib::Response& res) {
        return json::parse(res.body);
    }

    TempDir scratch;
    ServerConfig cfg;
};

} // namespace

// -----------------------------------------------------------------------------
// Success
// -----------------------------------------------------------------------------
TEST_F(ConvertRouteTest, ConvertsAndReturnsAttachment)
{
    FakeConverter conv(FakeConverter::Mode::WriteDocx);
    auto res = post(conv, R"({"markdown": "# Hello\n\nWorld"})");

    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(res.body, kDocxBytes);
    EXPECT_EQ(res.get_header_value("Content-Type"), DOCX_MIME_TYPE);
    EXPECT_EQ(res.get_header_value("Content-Disposition"),
              "attachment; filename=\"converted_document.docx\"");
    EXPECT_EQ(conv.calls.load(), 1);
    ASSERT_EQ(conv.inputs.size(), 1u);
    EXPECT_EQ(conv.inputs[0], "# Hello\n\nWorld");
    EXPECT_EQ(scratch.entry_count(), 0u);
}

TEST_F(ConvertRouteTest, ScratchPathsLiveInScratchDirAndShareToken)
{
    FakeConverter conv(FakeConverter::Mode::WriteDocx);
    post(conv, R"({"markdown": "x"})");

    ASSERT_EQ(conv.input_paths.size(), 1u);
    fs::path in(conv.input_paths[0]);
    fs::path out(conv.output_paths[0]);

    EXPECT_EQ(in.parent_path(), scratch.path());
    EXPECT_EQ(out.parent_path(), scratch.path());
    EXPECT_EQ(in.extension(), ".md");
    EXPECT_EQ(out.extension(), ".docx");
    EXPECT_EQ(in.stem(), out.stem());
}

TEST_F(ConvertRouteTest, TokenNeverReachesClient)
{
    FakeConverter conv(FakeConverter::Mode::WriteDocx);
    auto res = post(conv, R"({"markdown": "x"})");

    string token = fs::path(conv.input_paths.at(0)).stem().string();
    EXPECT_EQ(res.body.find(token), string::npos);
    for (const auto& h : res.headers) {
        EXPECT_EQ(h.second.find(token), string::npos) << h.first;
    }
}

TEST_F(ConvertRouteTest, PreservesUnicodeBytes)
{
    const string text = "# 你好, мир 🌍\n\nΩμέγα – café ∑ 𝔘𝔫𝔦𝔠𝔬𝔡𝔢";
    FakeConverter conv(FakeConverter::Mode::EchoInput);
    auto res = post(conv, json({{"markdown", text}}).dump());

    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(conv.inputs.at(0), text);
    EXPECT_EQ(res.body, text);
}

TEST_F(ConvertRouteTest, PassesConfiguredTimeout)
{
    cfg.convert_timeout = std::chrono::seconds(7);
    FakeConverter conv(FakeConverter::Mode::WriteDocx);
    post(conv, R"({"markdown": "x"})");
    EXPECT_EQ(conv.last_timeout, std::chrono::seconds(7));
}

TEST_F(ConvertRouteTest, WhitespaceOnlyMarkdownIsStillConverted)
{
    FakeConverter conv(FakeConverter::Mode::WriteDocx);
    auto res = post(conv, R"({"markdown": "   "})");
    EXPECT_EQ(res.status, 200);
    EXPECT_EQ(conv.calls.load(), 1);
}

TEST_F(ConvertRouteTest, AcceptsJsonContentTypeVariants)
{
    for (const string ct : {"application/json; charset=utf-8", "Application/JSON",
                            "application/vnd.api+json", " application/json "}) {
        FakeConverter conv(FakeConverter::Mode::WriteDocx);
        auto res = post(conv, R"({"markdown": "x"})", ct);
        EXPECT_EQ(res.status, 200) << ct;
    }
}

// -----------------------------------------------------------------------------
// Validation: nothing spawned, nothing written
// -----------------------------------------------------------------------------
TEST_F(ConvertRouteTest, RejectsNonJsonContentType)
{
    for (const string ct : {"text/plain", "application/x-www-form-urlencoded",
                            "multipart/form-data; boundary=x", "text/json+plain", ""}) {
        FakeConverter conv(FakeConverter::Mode::WriteDocx);
        auto res = post(conv, R"({"markdown": "x"})", ct);

        EXPECT_EQ(res.status, 415) << ct;
        EXPECT_EQ(body_json(res), json({{"error", "Request must be JSON"}}));
        EXPECT_EQ(conv.calls.load(), 0);
    }
    EXPECT_EQ(scratch.entry_count(), 0u);
}

TEST_F(ConvertRouteTest, EmptyObjectIsBadRequest)
{
    FakeConverter conv(FakeConverter::Mode::WriteDocx);
    auto res = post(conv, "{}");

    EXPECT_EQ(res.status, 400);
    EXPECT_EQ(res.get_header_value("Content-Type"), "application/json");
    EXPECT_EQ(body_json(res), json({{"error", "Missing 'markdown' key in request body"}}));
    EXPECT_EQ(conv.calls.load(), 0);
    EXPECT_EQ(scratch.entry_count(), 0u);
}

TEST_F(ConvertRouteTest, NullEmptyOrNonStringMarkdownIsBadRequest)
{
    for (const string body : {R"({"markdown": null})", R"({"markdown": ""})",
                              R"({"markdown": 42})", R"({"markdown": ["# a"]})",
                              R"({"text": "# a"})", "[]", "\"# a\""}) {
        FakeConverter conv(FakeConverter::Mode::WriteDocx);
        auto res = post(conv, body);

        EXPECT_EQ(res.status, 400) << body;
        EXPECT_EQ(body_json(res)["error"], "Missing 'markdown' key in request body") << body;
        EXPECT_EQ(conv.calls.load(), 0);
    }
    EXPECT_EQ(scratch.entry_count(), 0u);
}

TEST_F(ConvertRouteTest, MalformedJsonIsBadRequest)
{
    FakeConverter conv(FakeConverter::Mode::WriteDocx);
    auto res = post(conv, R"({"markdown": )");

    EXPECT_EQ(res.status, 400);
    EXPECT_EQ(body_json(res)["error"], "Invalid JSON in request body");
    EXPECT_EQ(conv.calls.load(), 0);
}

// -----------------------------------------------------------------------------
// Converter outcomes
// -----------------------------------------------------------------------------
TEST_F(ConvertRouteTest, NonZeroExitReturnsDetails)
{
    FakeConverter conv(FakeConverter::Mode::FailExit);
    auto res = post(conv, R"({"markdown": "x"})");

    EXPECT_EQ(res.status, 500);
    auto j = body_json(res);
    EXPECT_EQ(j["error"], "Pandoc conversion failed");
    EXPECT_EQ(j["details"], "pandoc: Unknown extension: foo\n");
    EXPECT_EQ(res.get_header_value("Content-Disposition"), "");
    EXPECT_EQ(scratch.entry_count(), 0u);
}

TEST_F(ConvertRouteTest, NonUtf8StderrStillYieldsValidJson)
{
    FakeConverter conv(FakeConverter::Mode::FailExit);
    conv.stderr_text = string("bad byte: \xff\xfe end");
    auto res = post(conv, R"({"markdown": "x"})");

    EXPECT_EQ(res.status, 500);
    json j;
    ASSERT_NO_THROW(j = body_json(res));
    EXPECT_EQ(j["error"], "Pandoc conversion failed");
    EXPECT_NE(j["details"].get<string>().find("bad byte"), string::npos);
}

TEST_F(ConvertRouteTest, MissingOutputAfterSuccessExit)
{
    FakeConverter conv(FakeConverter::Mode::NoOutput);
    auto res = post(conv, R"({"markdown": "x"})");

    EXPECT_EQ(res.status, 500);
    EXPECT_EQ(body_json(res), json({{"error", "Converted file not found on server"}}));
    EXPECT_EQ(scratch.entry_count(), 0u);
}

TEST_F(ConvertRouteTest, TimeoutIsReportedAndPartialOutputRemoved)
{
    FakeConverter conv(FakeConverter::Mode::Timeout);
    auto res = post(conv, R"({"markdown": "x"})");

    EXPECT_EQ(res.status, 500);
    EXPECT_EQ(body_json(res), json({{"error", "Pandoc conversion timed out"}}));
    EXPECT_EQ(scratch.entry_count(), 0u);
}

TEST_F(ConvertRouteTest, ConverterExceptionBecomesInternalError)
{
    FakeConverter conv(FakeConverter::Mode::Throw);
    auto res = post(conv, R"({"markdown": "x"})");

    EXPECT_EQ(res.status, 500);
    EXPECT_EQ(body_json(res), json({{"error", "Internal server error"}}));
    EXPECT_EQ(scratch.entry_count(), 0u);
}

TEST_F(ConvertRouteTest, UnreadableOutputIsInternalError)
{
    FakeConverter conv(FakeConverter::Mode::OutputIsDir);
    auto res = post(conv, R"({"markdown": "x"})");

    EXPECT_EQ(res.status, 500);
    EXPECT_EQ(body_json(res), json({{"error", "Failed to read converted file"}}));
    EXPECT_EQ(scratch.entry_count(), 0u);
}

TEST_F(ConvertRouteTest, EmptyOutputIsInternalError)
{
    FakeConverter conv(FakeConverter::Mode::EmptyOutput);
    auto res = post(conv, R"({"markdown": "x"})");

    EXPECT_EQ(res.status, 500);
    EXPECT_EQ(body_json(res), json({{"error", "Failed to read converted file"}}));
    EXPECT_EQ(scratch.entry_count(), 0u);
}

TEST_F(ConvertRouteTest, UnwritableScratchDirSkipsConverter)
{
    cfg.scratch_dir = (scratch.path() / "missing" / "dir").string();
    FakeConverter conv(FakeConverter::Mode::WriteDocx);
    auto res = post(conv, R"({"markdown": "x"})");

    EXPECT_EQ(res.status, 500);
    EXPECT_EQ(body_json(res), json({{"error", "Failed to prepare conversion"}}));
    EXPECT_EQ(conv.calls.load(), 0);
}

// -----------------------------------------------------------------------------
// Concurrency
// -----------------------------------------------------------------------------
TEST_F(ConvertRouteTest, ConcurrentRequestsAreIsolated)
{
    constexpr int kRequests = 24;
    FakeConverter conv(FakeConverter::Mode::EchoInput);

    vector<string> bodies(kRequests);
    vector<thread> workers;

    for (int i = 0; i < kRequests; ++i) {
        workers.emplace_back([&, i] {
            string text = "# Document " + to_string(i) + "\n\n" + string(1000 + i, 'a' + (i % 26));
            auto res = post(conv, json({{"markdown", text}}).dump());
            bodies[i] = (res.status == 200 && res.body == text) ? "ok" : "mismatch";
        });
    }
    for (auto& w : workers) w.join();

    for (int i = 0; i < kRequests; ++i) EXPECT_EQ(bodies[i], "ok") << i;

    std::set<string> distinct(conv.input_paths.begin(), conv.input_paths.end());
    EXPECT_EQ(distinct.size(), static_cast<size_t>(kRequests));
    EXPECT_EQ(scratch.entry_count(), 0u);
}

// -----------------------------------------------------------------------------
// End to end over HTTP
// -----------------------------------------------------------------------------
namespace {

// Runs a fully wired server on an ephemeral loopback port for one test.
class LiveServer {
public:
    LiveServer(const ServerConfig& cfg, PandocConverter& pandoc) {
        register_cors(svr_);
        register_convert_routes(svr_, cfg, pandoc);
        register_health_routes(svr_, cfg, pandoc);
        port_ = svr_.bind_to_any_port("127.0.0.1");
        worker_ = thread([this] { svr_.listen_after_bind(); });

        for (int i = 0; i < 200 && !svr_.is_running(); ++i) std::this_thread::sleep_for(10ms);
    }

    ~LiveServer() {
        svr_.stop();
        if (worker_.joinable()) worker_.join();
    }

    int port() const { return port_; }

private:
    httplib::Server svr_;
    thread worker_;
    int port_ = -1;
};

} // namespace

TEST(ConvertRouteHttp, ServesConversionHealthAndCors)
{
    TempDir scratch;
    TempDir bin;
    string fake = write_script(bin, "pandoc",
        "if [ \"$1\" = \"--version\" ]; then echo 'pandoc 3.1.11'; exit 0; fi\n"
        "[ \"$2\" = \"-o\" ] || exit 9\n"
        "cp \"$1\" \"$3\"");

    ServerConfig cfg;
    cfg.scratch_dir = scratch.str();
    cfg.converter_path = fake;
    PandocConverter pandoc(fake);

    LiveServer server(cfg, pandoc);
    ASSERT_GT(server.port(), 0);
    httplib::Client cli("127.0.0.1", server.port());

    auto conv = cli.Post("/api/convert", R"({"markdown": "# Hello\n\nWorld"})", "application/json");
    ASSERT_TRUE(conv);
    EXPECT_EQ(conv->status, 200);
    EXPECT_EQ(conv->body, "# Hello\n\nWorld");
    EXPECT_EQ(conv->get_header_value("Content-Type"), DOCX_MIME_TYPE);
    EXPECT_EQ(conv->get_header_value("Content-Disposition"),
              "attachment; filename=\"converted_document.docx\"");
    EXPECT_EQ(conv->get_header_value("Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(scratch.entry_count(), 0u);

    auto bad = cli.Post("/api/convert", "markdown=x", "text/plain");
    ASSERT_TRUE(bad);
    EXPECT_EQ(bad->status, 415);

    auto pre = cli.Options("/api/convert");
    ASSERT_TRUE(pre);
    EXPECT_EQ(pre->status, 204);
    EXPECT_EQ(pre->get_header_value("Access-Control-Allow-Methods"), "GET, POST, OPTIONS");

    auto health = cli.Get("/api/health");
    ASSERT_TRUE(health);
    EXPECT_EQ(health->status, 200);
    auto h = json::parse(health->body);
    EXPECT_EQ(h["status"], "ok");
    EXPECT_EQ(h["pandoc_available"], true);
    EXPECT_EQ(h["pandoc_version"], "pandoc 3.1.11");
    EXPECT_EQ(h["timeout_sec"], 30);
}
