#include <gtest/gtest.h>
#include <ichain/invoker.hpp>
#include <atomic>
#include "test-helpers.hpp"

namespace {

using namespace ichain;
using test::json;

class RecordingHook : public ExecutionHook {
 public:
  int before = 0;
  int after = 0;
  StatusCode last = StatusCode::OK;

  void before_invoke(InvocationContext*) override { ++before; }
  void after_invoke(InvocationContext* context) override {
    ++after;
    last = context->status.code();
  }
};

class ThrowingHook : public ExecutionHook {
 public:
  void before_invoke(InvocationContext*) override { throw std::runtime_error("hook failed"); }
  void after_invoke(InvocationContext*) override { throw std::runtime_error("hook failed"); }
};

// Per-call target destroyed synchronously
class Masker {
  std::shared_ptr<std::atomic<int>> destroyed;

 public:
  explicit Masker(std::shared_ptr<std::atomic<int>> const& counter) : destroyed(counter) {}
  ~Masker() { ++*destroyed; }

  pb::Value mask(std::string const& secret) { return test::text(std::string(secret.size(), '*')); }
};

// Per-call target disposed asynchronously
class Auditor : public AsyncDisposable {
  std::shared_ptr<std::atomic<int>> disposed;

 public:
  explicit Auditor(std::shared_ptr<std::atomic<int>> const& counter) : disposed(counter) {}

  Findings audit(int amount) {
    msgs::ValidationResult finding;
    finding.set_severity(amount > 100 ? msgs::ERROR : msgs::INFO);
    finding.set_message("audited");
    finding.set_path("$.amount");
    return {finding};
  }

  std::future<void> dispose_async() override {
    auto counter = disposed;
    return std::async(std::launch::async, [counter] { ++*counter; });
  }
};

TEST(Normalize, PayloadsOnlyCountForMutations) {
  auto payload = test::text("changed");
  EXPECT_TRUE(normalize(InterceptorType::MUTATION, payload).has_modified_payload());
  EXPECT_FALSE(normalize(InterceptorType::VALIDATION, payload).has_modified_payload());
  EXPECT_FALSE(normalize(InterceptorType::OBSERVABILITY, payload).has_modified_payload());

  msgs::InvokeInterceptorResult full;
  *full.mutable_modified_payload() = payload;
  (*full.mutable_metadata())["seen"].set_bool_value(true);
  auto observed = normalize(InterceptorType::OBSERVABILITY, full);
  EXPECT_FALSE(observed.has_modified_payload());
  EXPECT_TRUE(observed.metadata().at("seen").bool_value());
  EXPECT_TRUE(normalize(InterceptorType::MUTATION, full).has_modified_payload());
}

TEST(Normalize, FindingsAndNothing) {
  msgs::ValidationResult finding;
  finding.set_severity(msgs::WARNING);
  auto result = normalize(InterceptorType::VALIDATION, Findings{finding, finding});
  EXPECT_EQ(result.validation_results_size(), 2);

  auto empty = normalize(InterceptorType::MUTATION, boost::blank());
  EXPECT_FALSE(empty.has_modified_payload());
  EXPECT_EQ(empty.validation_results_size(), 0);
  EXPECT_TRUE(empty.metadata().empty());
}

TEST(Invoker, UnknownReturnTypesCarryNothing) {
  auto interceptor = make_interceptor(test::options("answer", InterceptorType::MUTATION), {},
                                      [] { return 42; });
  auto result = Invoker().invoke(interceptor, test::invoke_request("answer", json("{}")), Context());
  EXPECT_FALSE(result.has_modified_payload());
}

TEST(Invoker, HandlerFailuresAreAttributed) {
  auto hook = std::make_shared<RecordingHook>();
  Invoker invoker;
  invoker.add_hook(hook);
  invoker.add_hook<ThrowingHook>();

  auto interceptor = make_interceptor(test::options("faulty", InterceptorType::VALIDATION), {},
                                      []() -> Findings { throw std::runtime_error("boom"); });
  try {
    invoker.invoke(interceptor, test::invoke_request("faulty", json("{}")), Context());
    FAIL() << "Expected HANDLER_FAILURE";
  } catch (Error const& e) {
    EXPECT_EQ(e.code(), StatusCode::HANDLER_FAILURE);
    EXPECT_EQ(e.interceptor_id(), "faulty");
    EXPECT_NE(std::string(e.what()).find("boom"), std::string::npos);
  }
  EXPECT_EQ(hook->before, 1);
  EXPECT_EQ(hook->after, 1);
  EXPECT_EQ(hook->last, StatusCode::HANDLER_FAILURE);
}

TEST(Invoker, ForeignThrowablesBecomeHandlerFailures) {
  auto hook = std::make_shared<RecordingHook>();
  Invoker invoker;
  invoker.add_hook(hook);

  auto interceptor = make_interceptor(test::options("odd", InterceptorType::OBSERVABILITY), {},
                                      []() -> Findings { throw 42; });
  try {
    invoker.invoke(interceptor, test::invoke_request("odd", json("{}")), Context());
    FAIL() << "Expected HANDLER_FAILURE";
  } catch (Error const& e) {
    EXPECT_EQ(e.code(), StatusCode::HANDLER_FAILURE);
    EXPECT_EQ(e.interceptor_id(), "odd");
    EXPECT_NE(std::string(e.what()).find("unknown exception"), std::string::npos);
  }
  EXPECT_EQ(hook->after, 1);
  EXPECT_EQ(hook->last, StatusCode::HANDLER_FAILURE);
}

TEST(Invoker, BindingFailuresKeepTheirCode) {
  auto hook = std::make_shared<RecordingHook>();
  Invoker invoker;
  invoker.add_hook(hook);

  auto interceptor = make_interceptor(test::options("typed", InterceptorType::MUTATION),
                                      {arg("count")}, [](int count) { return count; });
  try {
    invoker.invoke(interceptor, test::invoke_request("typed", json(R"({"count": "3"})")),
                   Context());
    FAIL() << "Expected PARAMETER_BINDING_FAILURE";
  } catch (Error const& e) {
    EXPECT_EQ(e.code(), StatusCode::PARAMETER_BINDING_FAILURE);
    EXPECT_EQ(e.interceptor_id(), "typed");
  }
  EXPECT_EQ(hook->last, StatusCode::PARAMETER_BINDING_FAILURE);
}

TEST(Invoker, ProgressIsForwardedWithTheCallerToken) {
  std::vector<msgs::ProgressNotification> sent;
  Context context;
  context.with_progress([&](msgs::ProgressNotification const& n) { sent.push_back(n); });

  auto interceptor = make_interceptor(test::options("slow", InterceptorType::MUTATION),
                                      {arg("progress")}, [](ProgressEmitter const& progress) {
                                        progress.report(1, 3, "first");
                                        progress.report(3, 3, "done");
                                      });

  auto request = test::invoke_request("slow", json("{}"));
  Invoker().invoke(interceptor, request, context);
  EXPECT_TRUE(sent.empty());

  request.mutable_meta()->set_progress_token("abc");
  Invoker().invoke(interceptor, request, context);
  ASSERT_EQ(sent.size(), 2u);
  EXPECT_EQ(sent[0].progress_token(), "abc");
  EXPECT_EQ(sent[1].message(), "done");
}

TEST(Invoker, TargetsAreDisposedAfterEveryCall) {
  auto destroyed = std::make_shared<std::atomic<int>>(0);
  auto masker = make_interceptor(
      test::options("masker", InterceptorType::MUTATION), {arg("secret")},
      [destroyed](msgs::InvokeInterceptorRequest const&) {
        return std::unique_ptr<Masker>(new Masker(destroyed));
      },
      &Masker::mask);

  Invoker invoker;
  auto request = test::invoke_request("masker", json(R"({"secret": "hunter2"})"));
  auto result = invoker.invoke(masker, request, Context());
  EXPECT_EQ(result.modified_payload().string_value(), "*******");
  invoker.invoke(masker, request, Context());
  EXPECT_EQ(destroyed->load(), 2);
}

TEST(Invoker, AsyncDisposalIsAwaited) {
  auto disposed = std::make_shared<std::atomic<int>>(0);
  auto auditor = make_interceptor(
      test::options("auditor", InterceptorType::VALIDATION), {arg("amount")},
      [disposed](msgs::InvokeInterceptorRequest const&) {
        return std::unique_ptr<Auditor>(new Auditor(disposed));
      },
      &Auditor::audit);

  auto result = Invoker().invoke(auditor, test::invoke_request("auditor", json(R"({"amount": 500})")),
                                 Context());
  ASSERT_EQ(result.validation_results_size(), 1);
  EXPECT_EQ(result.validation_results(0).severity(), msgs::ERROR);
  EXPECT_EQ(result.validation_results(0).path(), "$.amount");
  EXPECT_EQ(disposed->load(), 1);
}

TEST(Invoker, RejectsParameterCountMismatch) {
  try {
    make_interceptor(test::options("arity", InterceptorType::MUTATION), {arg("a")},
                     [](int, int) { return 0; });
    FAIL() << "Expected INVALID_ARGUMENT";
  } catch (Error const& e) {
    EXPECT_EQ(e.code(), StatusCode::INVALID_ARGUMENT);
  }
}

}  // namespace
