#pragma once
#include <QFuture>
#include <QPromise>
#include <exception>
#include <utility>

namespace FutureUtils {

// Already finished future holding value.
template <typename T>
QFuture<T> ready(T value)
{
    QPromise<T> promise;
    promise.start();
    promise.addResult(std::move(value));
    promise.finish();
    return promise.future();
}

inline QFuture<void> ready()
{
    QPromise<void> promise;
    promise.start();
    promise.finish();
    return promise.future();
}

// Already finished future carrying error.
template <typename T, typename E>
QFuture<T> failed(const E& error)
{
    QPromise<T> promise;
    promise.start();
    promise.setException(std::make_exception_ptr(error));
    promise.finish();
    return promise.future();
}

} // namespace FutureUtils
