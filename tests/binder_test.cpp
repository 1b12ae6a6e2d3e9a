#include <gtest/gtest.h>
#include <ichain/binder.hpp>
#include "test-helpers.hpp"

namespace {

using namespace ichain;
using test::json;

struct Greeter {
  std::string greeting;
};

msgs::InvokeInterceptorRequest request_with(pb::Value const& payload) {
  auto request = test::invoke_request("binder", payload);
  request.mutable_meta()->set_progress_token("token-1");
  return request;
}

template <typename T>
T bound(Interceptor::Arguments const& arguments, std::size_t i) {
  return boost::any_cast<T>(arguments.at(i));
}

TEST(ParameterBinder, WellKnownValuesByType) {
  auto interceptor = make_interceptor(
      test::options("binder", InterceptorType::VALIDATION),
      {arg("token"), arg("server"), arg("request"), arg("progress"), arg("context")},
      [](CancellationToken const&, ServerHandle const&, msgs::InvokeInterceptorRequest const&,
         ProgressEmitter const&, Context const&) {});

  CancellationSource source;
  std::vector<msgs::ProgressNotification> sent;
  Context context("call-1");
  context.with_token(source.token())
      .with_server({"server-1", "session-1"})
      .with_progress([&](msgs::ProgressNotification const& n) { sent.push_back(n); });

  auto request = request_with(json(R"({"text": "hi"})"));
  auto arguments = ParameterBinder().bind(interceptor, request, context);
  ASSERT_EQ(arguments.size(), 5u);

  auto token = bound<CancellationToken>(arguments, 0);
  EXPECT_FALSE(token.cancelled());
  source.cancel();
  EXPECT_TRUE(token.cancelled());

  EXPECT_EQ(bound<ServerHandle>(arguments, 1).server_id, "server-1");
  EXPECT_EQ(bound<ServerHandle>(arguments, 1).session_id, "session-1");
  EXPECT_EQ(bound<msgs::InvokeInterceptorRequest>(arguments, 2).interceptor_id(), "binder");

  auto progress = bound<ProgressEmitter>(arguments, 3);
  EXPECT_TRUE(progress.enabled());
  progress.report(1, 2, "half");
  ASSERT_EQ(sent.size(), 1u);
  EXPECT_EQ(sent[0].progress_token(), "token-1");
  EXPECT_EQ(sent[0].total(), 2.0);

  EXPECT_EQ(bound<Context>(arguments, 4).id(), "call-1");
}

TEST(ParameterBinder, ProgressWithoutTokenIsDropped) {
  auto interceptor = make_interceptor(test::options("binder", InterceptorType::VALIDATION),
                                      {arg("progress")}, [](ProgressEmitter const&) {});
  int sent = 0;
  Context context;
  context.with_progress([&](msgs::ProgressNotification const&) { ++sent; });

  auto arguments =
      ParameterBinder().bind(interceptor, test::invoke_request("binder", json("{}")), context);
  auto progress = bound<ProgressEmitter>(arguments, 0);
  EXPECT_FALSE(progress.enabled());
  progress.report(1);
  EXPECT_EQ(sent, 0);
}

TEST(ParameterBinder, Services) {
  auto plain = std::make_shared<Greeter>(Greeter{"hello"});
  auto primary = std::make_shared<Greeter>(Greeter{"primary"});
  auto formal = std::make_shared<Greeter>(Greeter{"good morning"});
  auto services = std::make_shared<ServiceCollection>();
  services->add(plain).add_keyed("primary", primary).add_keyed("formal", formal);

  auto interceptor = make_interceptor(
      test::options("binder", InterceptorType::VALIDATION),
      {service("greeter"), arg("automatic"), keyed_service("primary"),
       keyed_service("other", "formal"), arg("resolver")},
      [](std::shared_ptr<Greeter> const&, std::shared_ptr<Greeter> const&,
         std::shared_ptr<Greeter> const&, std::shared_ptr<Greeter> const&,
         std::shared_ptr<ServiceResolver> const&) {});

  Context context;
  context.with_services(services);
  auto arguments =
      ParameterBinder().bind(interceptor, test::invoke_request("binder", json("{}")), context);

  EXPECT_EQ(bound<std::shared_ptr<Greeter>>(arguments, 0), plain);
  EXPECT_EQ(bound<std::shared_ptr<Greeter>>(arguments, 1), plain);
  EXPECT_EQ(bound<std::shared_ptr<Greeter>>(arguments, 2), primary);
  EXPECT_EQ(bound<std::shared_ptr<Greeter>>(arguments, 3), formal);
  EXPECT_EQ(bound<std::shared_ptr<ServiceResolver>>(arguments, 4), services);
}

TEST(ParameterBinder, MissingServices) {
  auto required = make_interceptor(test::options("required", InterceptorType::VALIDATION),
                                   {service("greeter")}, [](std::shared_ptr<Greeter> const&) {});
  auto optional = make_interceptor(test::options("optional", InterceptorType::VALIDATION),
                                   {optional_service("greeter")},
                                   [](std::shared_ptr<Greeter> const&) {});
  auto keyed = make_interceptor(test::options("keyed", InterceptorType::VALIDATION),
                                {keyed_service("greeter", "missing")},
                                [](std::shared_ptr<Greeter> const&) {});

  Context context;
  context.with_services(std::make_shared<ServiceCollection>());
  auto request = test::invoke_request("binder", json("{}"));

  try {
    ParameterBinder().bind(required, request, context);
    FAIL() << "Expected MISSING_REQUIRED_PARAMETER";
  } catch (Error const& e) {
    EXPECT_EQ(e.code(), StatusCode::MISSING_REQUIRED_PARAMETER);
    EXPECT_EQ(e.interceptor_id(), "required");
  }

  try {
    ParameterBinder().bind(keyed, request, context);
    FAIL() << "Expected MISSING_REQUIRED_PARAMETER";
  } catch (Error const& e) {
    EXPECT_EQ(e.code(), StatusCode::MISSING_REQUIRED_PARAMETER);
    EXPECT_NE(std::string(e.what()).find("missing"), std::string::npos);
  }

  auto arguments = ParameterBinder().bind(optional, request, Context());
  EXPECT_EQ(bound<std::shared_ptr<Greeter>>(arguments, 0), nullptr);
}

TEST(ParameterBinder, PayloadFieldsByName) {
  auto interceptor = make_interceptor(
      test::options("binder", InterceptorType::MUTATION),
      {arg("name"), arg("count"), arg("strict"), arg("tags"), arg("ratio"), arg("limit", json("7")),
       arg("nested")},
      [](std::string const&, int, bool, std::vector<std::string> const&,
         boost::optional<double> const&, unsigned, pb::Struct const&) {});

  auto request = test::invoke_request(
      "binder",
      json(R"({"name": "ana", "count": 3, "strict": true, "tags": ["a", "b"], "ratio": null,
               "nested": {"k": "v"}})"));
  auto original = request;
  auto arguments = ParameterBinder().bind(interceptor, request, Context());

  EXPECT_EQ(bound<std::string>(arguments, 0), "ana");
  EXPECT_EQ(bound<int>(arguments, 1), 3);
  EXPECT_TRUE(bound<bool>(arguments, 2));
  EXPECT_EQ(bound<std::vector<std::string>>(arguments, 3), (std::vector<std::string>{"a", "b"}));
  EXPECT_FALSE(bound<boost::optional<double>>(arguments, 4));
  EXPECT_EQ(bound<unsigned>(arguments, 5), 7u);
  EXPECT_EQ(bound<pb::Struct>(arguments, 6).fields().at("k").string_value(), "v");
  EXPECT_EQ(request.SerializeAsString(), original.SerializeAsString());
}

TEST(ParameterBinder, MissingPayloadField) {
  auto interceptor = make_interceptor(test::options("binder", InterceptorType::MUTATION),
                                      {arg("name")}, [](std::string const&) {});
  try {
    ParameterBinder().bind(interceptor, test::invoke_request("binder", json("{}")), Context());
    FAIL() << "Expected MISSING_REQUIRED_PARAMETER";
  } catch (Error const& e) {
    EXPECT_EQ(e.code(), StatusCode::MISSING_REQUIRED_PARAMETER);
    EXPECT_EQ(e.interceptor_id(), "binder");
  }

  // a payload that is not an object has no fields at all
  try {
    ParameterBinder().bind(interceptor, test::invoke_request("binder", test::text("ana")),
                           Context());
    FAIL() << "Expected MISSING_REQUIRED_PARAMETER";
  } catch (Error const& e) {
    EXPECT_EQ(e.code(), StatusCode::MISSING_REQUIRED_PARAMETER);
  }
}

TEST(ParameterBinder, TypeMismatch) {
  auto text = make_interceptor(test::options("text", InterceptorType::MUTATION), {arg("name")},
                               [](std::string const&) {});
  auto integer = make_interceptor(test::options("integer", InterceptorType::MUTATION),
                                  {arg("count")}, [](int) {});

  try {
    ParameterBinder().bind(text, test::invoke_request("text", json(R"({"name": 42})")), Context());
    FAIL() << "Expected PARAMETER_BINDING_FAILURE";
  } catch (Error const& e) {
    EXPECT_EQ(e.code(), StatusCode::PARAMETER_BINDING_FAILURE);
    EXPECT_EQ(e.interceptor_id(), "text");
    EXPECT_NE(std::string(e.what()).find("'name'"), std::string::npos);
  }

  try {
    ParameterBinder().bind(integer, test::invoke_request("integer", json(R"({"count": 2.5})")),
                           Context());
    FAIL() << "Expected PARAMETER_BINDING_FAILURE";
  } catch (Error const& e) {
    EXPECT_EQ(e.code(), StatusCode::PARAMETER_BINDING_FAILURE);
  }
}

TEST(ParameterBinder, MessagesThroughJson) {
  auto interceptor = make_interceptor(test::options("binder", InterceptorType::VALIDATION),
                                      {arg("finding")}, [](msgs::ValidationResult const&) {});

  auto good = test::invoke_request(
      "binder", json(R"({"finding": {"severity": "WARNING", "message": "careful"}})"));
  auto arguments = ParameterBinder().bind(interceptor, good, Context());
  auto finding = bound<msgs::ValidationResult>(arguments, 0);
  EXPECT_EQ(finding.severity(), msgs::WARNING);
  EXPECT_EQ(finding.message(), "careful");

  auto bad = test::invoke_request("binder", json(R"({"finding": {"severity": "BOGUS"}})"));
  try {
    ParameterBinder().bind(interceptor, bad, Context());
    FAIL() << "Expected SERIALIZATION_ERROR";
  } catch (Error const& e) {
    EXPECT_EQ(e.code(), StatusCode::SERIALIZATION_ERROR);
  }
}

}  // namespace
