#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include "dronefleet/util/json.h"

#define DF_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

std::string parse_error_message(const std::string& text) {
  try {
    (void)dronefleet::json::parse(text);
  } catch (const std::runtime_error& e) {
    return std::string(e.what());
  }
  return {};
}

} // namespace

int test_json() {
  using namespace dronefleet;

  // Basic document.
  {
    const auto v = json::parse("{\"a\": 1, \"b\": [true, null, \"ok\"], \"c\": {\"d\": -2.5e1}}");
    DF_ASSERT(v.is_object());
    DF_ASSERT(v.at("a").int_value() == 1);
    DF_ASSERT(v.at("b").array().size() == 3);
    DF_ASSERT(v.at("b").array()[0].bool_value() == true);
    DF_ASSERT(v.at("b").array()[1].is_null());
    DF_ASSERT(v.at("b").array()[2].string_value() == "ok");
    DF_ASSERT(v.at("c").at("d").number_value() == -25.0);
    DF_ASSERT(v.find("missing") == nullptr);
    DF_ASSERT(json::type_name(v.at("b")) == std::string("array"));
  }

  // Compact output has sorted keys and no whitespace.
  {
    json::Object o;
    o["z"] = 1;
    o["a"] = "x";
    o["m"] = json::Array{true, nullptr, 2.5};
    DF_ASSERT(json::stringify(o, 0) == "{\"a\":\"x\",\"m\":[true,null,2.5],\"z\":1}");

    const std::string pretty = json::stringify(o, 2);
    DF_ASSERT(pretty.find('\n') != std::string::npos);
    DF_ASSERT(json::parse(pretty).at("z").int_value() == 1);
  }

  // Non-finite numbers have no JSON form.
  {
    json::Array a{std::numeric_limits<double>::infinity(), std::nan("")};
    DF_ASSERT(json::stringify(a, 0) == "[null,null]");
  }

  // Escapes, including a surrogate pair.
  {
    const auto v = json::parse("\"tab\\tq\\\"\\u00e9\\ud83d\\ude00\"");
    DF_ASSERT(v.string_value() == "tab\tq\"\xC3\xA9\xF0\x9F\x98\x80");
    DF_ASSERT(json::stringify(json::Value("a\nb"), 0) == "\"a\\nb\"");
  }

  // Byte order mark is skipped.
  {
    const auto v = json::parse("\xEF\xBB\xBF {\"x\": 2}\n");
    DF_ASSERT(v.at("x").int_value() == 2);
  }

  // Errors report line and column.
  {
    const std::string msg = parse_error_message("[\n  1,\n  ,\n  2\n]\n");
    DF_ASSERT(msg.find("line 3, col 3") != std::string::npos);
    DF_ASSERT(msg.find("unexpected") != std::string::npos);
  }
  {
    const std::string msg = parse_error_message("{\"a\": 1,\n \"b\": 2");
    DF_ASSERT(msg.find("line 2") != std::string::npos);
    DF_ASSERT(msg.find("expected") != std::string::npos);
  }
  DF_ASSERT(!parse_error_message("{\"a\": 1} x").empty());
  DF_ASSERT(!parse_error_message("[01]").empty());
  DF_ASSERT(!parse_error_message("\"\\q\"").empty());
  DF_ASSERT(!parse_error_message(std::string(300, '[') + std::string(300, ']')).empty());

  // Typed accessors throw on the wrong type.
  {
    const auto v = json::parse("[1]");
    bool threw = false;
    try {
      (void)v.object();
    } catch (const std::runtime_error&) {
      threw = true;
    }
    DF_ASSERT(threw);
  }

  return 0;
}
