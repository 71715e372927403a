#include <gtest/gtest.h>

#include <boost/json.hpp>
#include <boost/program_options.hpp>

#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "carrierctrl_common.hpp"
#include "conf/carrierctrl_config.hpp"
#include "customio/console_output.hpp"
#include "handlers/conf_handler.hpp"
#include "my_error_codes.hpp"

using namespace carrierctrl;
namespace json = boost::json;

namespace {

class InMemoryConfigProvider : public ICarrierctrlConfigProvider {
public:
  CarrierctrlConfig config;
  std::vector<json::object> saved;
  std::optional<Error> fail_with;

  const CarrierctrlConfig &get() const override { return config; }
  CarrierctrlConfig &get() override { return config; }

  std::optional<Error> save(const json::object &content) override {
    if (fail_with) {
      return fail_with;
    }
    saved.push_back(content);
    return std::nullopt;
  }
};

CliCtx make_ctx(std::vector<std::string> positionals) {
  CliParams params{};
  if (!positionals.empty()) {
    params.subcmd = positionals.front();
  }
  return CliCtx(po::variables_map{}, std::move(positionals), {},
                std::move(params));
}

std::optional<Error> run(ConfHandler &handler) {
  std::optional<Error> result;
  bool called = false;
  handler.start([&](std::optional<Error> err) {
    called = true;
    result = std::move(err);
  });
  EXPECT_TRUE(called);
  return result;
}

} // namespace

class ConfHandlerTest : public ::testing::Test {
protected:
  InMemoryConfigProvider provider;
  std::ostringstream console;
  customio::ConsoleOutput output{3, console};
};

TEST_F(ConfHandlerTest, SetTimeoutPersistsFragment) {
  auto ctx = make_ctx({"conf", "set", "install_check.timeout_seconds", "75"});
  ConfHandler handler(provider, ctx, output);
  EXPECT_FALSE(run(handler).has_value());
  EXPECT_EQ(provider.config.install_check.timeout_seconds, 75);
  ASSERT_EQ(provider.saved.size(), 1u);
  EXPECT_EQ(provider.saved[0]
                .at("install_check")
                .as_object()
                .at("timeout_seconds")
                .to_number<int>(),
            75);
}

TEST_F(ConfHandlerTest, RejectsNonPositiveTimeout) {
  for (const char *value : {"0", "-5", "ten", "10s"}) {
    auto ctx = make_ctx({"conf", "set", "install_check.timeout_seconds", value});
    ConfHandler handler(provider, ctx, output);
    auto err = run(handler);
    ASSERT_TRUE(err.has_value()) << value;
    EXPECT_EQ(err->code, my_errors::GENERAL::INVALID_ARGUMENT);
  }
  EXPECT_TRUE(provider.saved.empty());
  EXPECT_EQ(provider.config.install_check.timeout_seconds, 40);
}

TEST_F(ConfHandlerTest, RejectsInvalidRegexPattern) {
  provider.config.install_check.syntax = "regex";
  auto ctx = make_ctx({"conf", "set", "install_check.pattern", "SIM ("});
  ConfHandler handler(provider, ctx, output);
  auto err = run(handler);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->code, my_errors::LOGSTREAM::FILTER_CONSTRUCTION);
  EXPECT_EQ(provider.config.install_check.pattern, "SIM is ready");
}

TEST_F(ConfHandlerTest, RejectsUnknownScope) {
  auto ctx = make_ctx({"conf", "set", "install_check.scope", "kernel"});
  ConfHandler handler(provider, ctx, output);
  auto err = run(handler);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->code, my_errors::GENERAL::INVALID_ARGUMENT);
}

TEST_F(ConfHandlerTest, SetCaseSensitiveParsesBool) {
  auto ctx = make_ctx({"conf", "set", "install_check.case_sensitive", "yes"});
  ConfHandler handler(provider, ctx, output);
  EXPECT_FALSE(run(handler).has_value());
  EXPECT_TRUE(provider.config.install_check.case_sensitive);
  auto value = handler.lookup("install_check.case_sensitive");
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, "true");
}

TEST_F(ConfHandlerTest, UnknownKeyShowsUsage) {
  auto ctx = make_ctx({"conf", "set", "colour", "blue"});
  ConfHandler handler(provider, ctx, output);
  auto err = run(handler);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->code, my_errors::GENERAL::SHOW_OPT_DESC);
}

TEST_F(ConfHandlerTest, SaveFailureIsReported) {
  provider.fail_with =
      make_error(my_errors::GENERAL::FILE_READ_WRITE, "read-only directory");
  auto ctx = make_ctx({"conf", "set", "verbose", "debug"});
  ConfHandler handler(provider, ctx, output);
  auto err = run(handler);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->code, my_errors::GENERAL::FILE_READ_WRITE);
}

TEST_F(ConfHandlerTest, GetKnownKey) {
  provider.config.installer.package_type = "CarrierBundle";
  auto ctx = make_ctx({"conf", "get", "installer.package_type"});
  ConfHandler handler(provider, ctx, output);
  EXPECT_FALSE(run(handler).has_value());
  EXPECT_FALSE(handler.lookup("nope").has_value());
}

TEST_F(ConfHandlerTest, NoOperationShowsUsage) {
  auto ctx = make_ctx({"conf"});
  ConfHandler handler(provider, ctx, output);
  auto err = run(handler);
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->code, my_errors::GENERAL::SHOW_OPT_DESC);
}
