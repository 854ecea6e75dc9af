#pragma once

#include <ticon/result.hpp>

#include <memory>
#include <utility>

namespace ticon {
namespace base {

// ObjectFactory - create protocol for shared_ptr interface types
//
//   1. Header declares the interface type (e.g. Font) with pure virtuals
//      and a static Result<Ptr> createImpl(...)
//   2. Cpp defines a private subclass (e.g. FreeTypeFontImpl) with init()
//   3. createImpl() builds the subclass, calls init(), returns Result<Ptr>
//
// Callers only ever use T::create(args...), never the subclass.
//
// Example:
//   Result<Font::Ptr> Font::createImpl(int pixelSize) {
//       auto impl = std::make_shared<FontImpl>(pixelSize);
//       if (auto res = impl->init(); !res) return Err<Ptr>("init failed", res);
//       return Ok(Ptr(std::move(impl)));
//   }
//
template<typename T>
class ObjectFactory {
public:
    using Ptr = std::shared_ptr<T>;

    template<typename... Args>
    static Result<Ptr> create(Args&&... args) {
        return T::createImpl(std::forward<Args>(args)...);
    }

protected:
    ObjectFactory() = default;
};

} // namespace base
} // namespace ticon
