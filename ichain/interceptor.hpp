#pragma once

#include <boost/any.hpp>
#include <boost/variant.hpp>
#include <future>
#include <memory>
#include <tuple>
#include <utility>
#include <vector>
#include "descriptor.hpp"
#include "parameter.hpp"

namespace ichain {

using Findings = std::vector<msgs::ValidationResult>;

// What an interceptor hands back: nothing, a payload, findings, or a complete result. The
// invoker decides what each alternative means for the interceptor's kind.
using Returned = boost::variant<boost::blank, pb::Value, Findings, msgs::InvokeInterceptorResult>;

// Per-call objects deriving from this are disposed asynchronously, the returned future is
// awaited before the object is destroyed.
struct AsyncDisposable {
  virtual ~AsyncDisposable() {}
  virtual std::future<void> dispose_async() = 0;
};

// Type erased per-call target object of an interceptor implemented as a member function.
struct Target {
  std::shared_ptr<void> object;
  std::function<std::future<void>()> dispose_async;
};

// A registered unit of logic: its descriptor, the arguments it expects and the callable.
class Interceptor {
 public:
  using Arguments = std::vector<boost::any>;
  using Handler = std::function<Returned(Arguments const&, void* target)>;
  using Activator = std::function<Target(msgs::InvokeInterceptorRequest const&)>;

 private:
  Descriptor desc;
  std::vector<Parameter> params;
  Handler handler;
  Activator activator;

 public:
  Interceptor(Descriptor const& descriptor, std::vector<Parameter> parameters, Handler handler,
              Activator activator = nullptr);

  Descriptor const& descriptor() const { return desc; }
  std::string const& id() const { return desc.id(); }
  InterceptorType type() const { return desc.type(); }
  std::vector<Parameter> const& parameters() const { return params; }

  bool has_target() const { return activator != nullptr; }
  Target activate(msgs::InvokeInterceptorRequest const& request) const { return activator(request); }
  Returned call(Arguments const& arguments, void* target) const {
    return handler(arguments, target);
  }

  // Same callable, different descriptor. Used to apply configuration overrides.
  Interceptor with_descriptor(Descriptor const& descriptor) const;
};

namespace detail {

inline Returned to_returned(pb::Value const& payload) {
  return payload;
}
inline Returned to_returned(msgs::ValidationResult const& finding) {
  return Findings{finding};
}
inline Returned to_returned(Findings const& findings) {
  return findings;
}
inline Returned to_returned(msgs::InvokeInterceptorResult const& result) {
  return result;
}
inline Returned to_returned(Returned const& returned) {
  return returned;
}
// Any other shape carries nothing the engine understands
template <typename T>
Returned to_returned(T const&) {
  return boost::blank();
}

template <typename R>
struct Call {
  template <typename F, typename... A>
  static Returned apply(F& f, A&&... a) {
    return to_returned(f(std::forward<A>(a)...));
  }
};

template <>
struct Call<void> {
  template <typename F, typename... A>
  static Returned apply(F& f, A&&... a) {
    f(std::forward<A>(a)...);
    return boost::blank();
  }
};

template <typename... Args>
struct TypeList {
  static constexpr std::size_t size = sizeof...(Args);
};

template <typename F>
struct FunctionTraits : FunctionTraits<decltype(&F::operator())> {};

template <typename R, typename... Args>
struct FunctionTraits<R (*)(Args...)> {
  using Result = R;
  using Arguments = TypeList<Args...>;
};

template <typename R, typename... Args>
struct FunctionTraits<R(Args...)> : FunctionTraits<R (*)(Args...)> {};

template <typename C, typename R, typename... Args>
struct FunctionTraits<R (C::*)(Args...)> : FunctionTraits<R (*)(Args...)> {};

template <typename C, typename R, typename... Args>
struct FunctionTraits<R (C::*)(Args...) const> : FunctionTraits<R (*)(Args...)> {};

template <typename T>
using Decay = typename std::decay<T>::type;

// Keeps a parameter out of template argument deduction
template <typename T>
struct Identity {
  using type = T;
};

template <typename... Args, std::size_t... I>
std::vector<Parameter> typed_parameters(std::vector<Parameter> const& declared, TypeList<Args...>,
                                        std::index_sequence<I...>) {
  return {typed<Decay<Args>>(declared[I])...};
}

template <typename R, typename F, typename... Args, std::size_t... I>
Returned call_with(F& f, Interceptor::Arguments const& arguments, TypeList<Args...>,
                   std::index_sequence<I...>) {
  return Call<R>::apply(f, boost::any_cast<Decay<Args>>(arguments[I])...);
}

void check_arity(Descriptor const& descriptor, std::size_t declared, std::size_t expected);

template <typename T>
std::function<std::future<void>()> async_disposer(T* object, std::true_type) {
  return [object] { return object->dispose_async(); };
}

template <typename T>
std::function<std::future<void>()> async_disposer(T*, std::false_type) {
  return nullptr;
}

}  // namespace detail

// Builds an interceptor from any callable. Each argument of the callable is described by the
// parameter at the same position, arguments are taken by value or const reference.
//
//   auto upper = make_interceptor(options, {arg("text")}, [](std::string const& text) {
//     return pb::Value(...);
//   });
template <typename F>
Interceptor make_interceptor(CreateOptions const& options, std::vector<Parameter> const& parameters,
                             F function, std::string const& function_name = "") {
  using Traits = detail::FunctionTraits<detail::Decay<F>>;
  using Result = typename Traits::Result;
  using Arguments = typename Traits::Arguments;
  using Indices = std::make_index_sequence<Arguments::size>;

  auto descriptor = make_descriptor(options, function_name);
  detail::check_arity(descriptor, parameters.size(), Arguments::size);

  auto handler = [function](Interceptor::Arguments const& arguments, void*) mutable {
    return detail::call_with<Result>(function, arguments, Arguments{}, Indices{});
  };
  return Interceptor(descriptor, detail::typed_parameters(parameters, Arguments{}, Indices{}),
                     handler);
}

// Builds an interceptor whose logic is a member function of T. A new T is created by the factory
// for every call and disposed once the call completes.
template <typename T, typename R, typename... Args>
Interceptor make_interceptor(
    CreateOptions const& options, std::vector<Parameter> const& parameters,
    typename detail::Identity<
        std::function<std::unique_ptr<T>(msgs::InvokeInterceptorRequest const&)>>::type factory,
    R (T::*method)(Args...), std::string const& function_name = "") {
  using Arguments = detail::TypeList<Args...>;
  using Indices = std::make_index_sequence<sizeof...(Args)>;

  auto descriptor = make_descriptor(options, function_name);
  detail::check_arity(descriptor, parameters.size(), sizeof...(Args));

  auto handler = [method](Interceptor::Arguments const& arguments, void* target) {
    auto object = static_cast<T*>(target);
    auto bound = [object, method](Args... args) { return (object->*method)(args...); };
    return detail::call_with<R>(bound, arguments, Arguments{}, Indices{});
  };

  auto activator = [factory](msgs::InvokeInterceptorRequest const& request) {
    std::shared_ptr<T> object = factory(request);
    Target target;
    target.dispose_async =
        detail::async_disposer(object.get(), std::is_base_of<AsyncDisposable, T>{});
    target.object = std::move(object);
    return target;
  };

  return Interceptor(descriptor, detail::typed_parameters(parameters, Arguments{}, Indices{}),
                     handler, activator);
}

}  // namespace ichain
