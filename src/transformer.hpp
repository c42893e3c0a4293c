// SPDX-License-Identifier: MIT

// src/transformer.hpp
#pragma once

#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "lib/stream/error.hpp"

namespace flowtap {

/// User logic of one transform stage.
///
/// A fresh instance is created for every materialization, so a transformer
/// may keep mutable state without any locking. All methods run on the
/// loop thread of that materialization.
///
/// OnNext() may return zero, one or many elements (drop, map, expand).
/// Throwing from OnNext() or OnTermination() fails the stage with
/// ErrorCode::StageFailed.
template<typename In, typename Out>
class Transformer {
public:
    virtual ~Transformer() = default;

    virtual std::vector<Out> OnNext(In element) = 0;

    /// Called once when upstream completes; returns trailing elements.
    virtual std::vector<Out> OnTermination() { return {}; }

    /// Returning true after OnNext() ends the stage early: upstream is
    /// cancelled and completion is sent downstream after buffered output.
    virtual bool IsComplete() const { return false; }

    /// Called exactly once when the stage terminates, whatever the reason.
    virtual void Cleanup() {}
};

template<typename In, typename Out>
using TransformerFactory = std::function<std::unique_ptr<Transformer<In, Out>>()>;

template<typename T>
class IdentityTransformer : public Transformer<T, T> {
public:
    std::vector<T> OnNext(T element) override {
        std::vector<T> out;
        out.push_back(std::move(element));
        return out;
    }
};

template<typename In, typename Out, typename F>
class MapTransformer : public Transformer<In, Out> {
public:
    explicit MapTransformer(F fn) : fn_(std::move(fn)) {}

    std::vector<Out> OnNext(In element) override {
        std::vector<Out> out;
        out.push_back(fn_(std::move(element)));
        return out;
    }

private:
    F fn_;
};

template<typename T, typename P>
class FilterTransformer : public Transformer<T, T> {
public:
    explicit FilterTransformer(P pred) : pred_(std::move(pred)) {}

    std::vector<T> OnNext(T element) override {
        std::vector<T> out;
        if (pred_(std::as_const(element))) out.push_back(std::move(element));
        return out;
    }

private:
    P pred_;
};

template<typename T>
TransformerFactory<T, T> identity_factory() {
    return [] { return std::make_unique<IdentityTransformer<T>>(); };
}

template<typename In, typename F>
    requires std::invocable<F, In>
auto map_factory(F fn) {
    using Out = std::decay_t<std::invoke_result_t<F, In>>;
    return TransformerFactory<In, Out>([fn = std::move(fn)] {
        return std::make_unique<MapTransformer<In, Out, F>>(fn);
    });
}

template<typename T, typename P>
    requires std::predicate<P, const T&>
TransformerFactory<T, T> filter_factory(P pred) {
    return [pred = std::move(pred)] {
        return std::make_unique<FilterTransformer<T, P>>(pred);
    };
}

}  // namespace flowtap
