#pragma once

#include <string_view>

#include <Serializable/Export.hpp>
#include <Serializable/Types.hpp>
#include <Serializable/Value.hpp>
#include <Serializable/Registry.hpp>
#include <Serializable/NameUtils.hpp>
#include <Serializable/ValueTraits.hpp>
#include <Serializable/TypeBuilder.hpp>
#include <Serializable/Callables.hpp>
#include <Serializable/ModuleInit.hpp>
#include <Serializable/Resolver.hpp>
#include <Serializable/Codec.hpp>
#include <Serializable/KeyCodec.hpp>
#include <Serializable/Json.hpp>

namespace Serializable
{

    // For quick sanity checks / examples.
    [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "Serializable"; }

} // namespace Serializable
