#include <doctest/doctest.h>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>
#include "meshz/config.hpp"
#include "temp_dir.hpp"

using namespace meshz;
using meshz_test::TempDir;
using json = nlohmann::json;

namespace {

bool apply(const char* text, Config& cfg, std::string& err) {
    return apply_json(json::parse(text), cfg, err);
}

} // namespace

TEST_CASE("Defaults validate and enable the stall guard") {
    const Config c = default_config();
    std::string err;
    CHECK(validate(c, err));
    CHECK(c.core.chunk_size == 120);
    CHECK(c.core.ack_timeout_ms == 30000);
    CHECK(c.core.max_retries == 5);
    CHECK(c.core.receive_stall_ms == Config::STALL_MS_DEFAULT);
    CHECK(c.core.file_prefix == "meshz_");
    CHECK(c.format == "pretty");
}

TEST_CASE("apply_json sets known keys") {
    Config c;
    std::string err;
    REQUIRE(apply(R"({"chunk_size": 64, "max_retries": 9, "device": "/dev/ttyUSB1",
                      "baud": 57600, "verbose": true, "download_dir": "/srv/in"})", c, err));
    CHECK(c.core.chunk_size == 64);
    CHECK(c.core.max_retries == 9);
    CHECK(c.device == "/dev/ttyUSB1");
    CHECK(c.baud == 57600);
    CHECK(c.verbose);
    CHECK(c.core.download_dir == "/srv/in");
}

TEST_CASE("apply_json names the offending key") {
    Config c;
    std::string err;

    CHECK_FALSE(apply(R"({"chunk_sise": 64})", c, err));
    CHECK(err == "chunk_sise: unknown key");

    CHECK_FALSE(apply(R"({"ack_timeout_ms": -5})", c, err));
    CHECK(err.rfind("ack_timeout_ms:", 0) == 0);

    CHECK_FALSE(apply(R"({"max_retries": 300})", c, err));
    CHECK(err == "max_retries: out of range");

    CHECK_FALSE(apply(R"({"color": "yes"})", c, err));
    CHECK(err.rfind("color:", 0) == 0);

    CHECK_FALSE(apply(R"({"device": 3})", c, err));
    CHECK(err.rfind("device:", 0) == 0);

    CHECK_FALSE(apply(R"([1, 2])", c, err));
}

TEST_CASE("validate rejects out-of-range settings") {
    std::string err;
    Config c = default_config();

    c.core.chunk_size = 181;
    CHECK_FALSE(validate(c, err));
    CHECK(err.rfind("chunk_size", 0) == 0);
    c.core.chunk_size = 0;
    CHECK_FALSE(validate(c, err));
    c.core.chunk_size = 180;
    CHECK(validate(c, err));

    c.core.watchdog_interval_ms = c.core.ack_timeout_ms + 1;
    CHECK_FALSE(validate(c, err));
    CHECK(err.rfind("watchdog_interval_ms", 0) == 0);
    c.core.watchdog_interval_ms = 1000;

    c.core.file_prefix = "../x";
    CHECK_FALSE(validate(c, err));
    c.core.file_prefix = "";
    CHECK(validate(c, err));

    c.baud = 12345;
    CHECK_FALSE(validate(c, err));
    CHECK(err.rfind("baud", 0) == 0);
    c.baud = 9600;

    c.format = "xml";
    CHECK_FALSE(validate(c, err));
    c.format = "json";

    c.loop_ms = 0;
    CHECK_FALSE(validate(c, err));
    c.loop_ms = 20;
    CHECK(validate(c, err));
}

TEST_CASE("load_config: missing file keeps defaults") {
    TempDir tmp;
    Config c = default_config();
    std::string err;
    REQUIRE(load_config(tmp.path / "absent.json", c, err));
    CHECK(c.core.chunk_size == Settings::CHUNK_SIZE_DEFAULT);
}

TEST_CASE("load_config is all-or-nothing") {
    TempDir tmp;
    const auto file = tmp.path / "meshz.json";
    { std::ofstream(file) << R"({"chunk_size": 50, "baud": "fast"})"; }

    Config c = default_config();
    std::string err;
    CHECK_FALSE(load_config(file, c, err));
    CHECK(err.find("baud") != std::string::npos);
    CHECK(c.core.chunk_size == Settings::CHUNK_SIZE_DEFAULT);

    { std::ofstream(file) << "{ not json"; }
    CHECK_FALSE(load_config(file, c, err));
}

TEST_CASE("save_config output loads back to the same values") {
    TempDir tmp;
    const auto file = tmp.path / "nested" / "meshz.json";

    Config out = default_config();
    out.core.chunk_size = 90;
    out.core.max_retries = 2;
    out.device = "/dev/ttyACM3";
    out.color = false;
    std::string err;
    REQUIRE(save_config(file, out, err));

    Config in;
    REQUIRE(load_config(file, in, err));
    CHECK(in.core.chunk_size == 90);
    CHECK(in.core.max_retries == 2);
    CHECK(in.device == "/dev/ttyACM3");
    CHECK_FALSE(in.color);
    CHECK(in.core.receive_stall_ms == Config::STALL_MS_DEFAULT);
    CHECK(to_json(in) == to_json(out));
}
