#pragma once

#include <bridgegrader/checkers/checker.hpp>
#include <bridgegrader/registrars/checker_registrar.hpp>

#include <concepts>
#include <memory>

namespace bridgegrader {

/// Helper class that, when constructed, automatically constructs and registers a checker
template <typename CheckerClass>
    requires(std::derived_from<CheckerClass, Checker>)
class CheckerAutoRegistrar
{
public:
    CheckerAutoRegistrar() { CheckerRegistrar::get().add(std::make_unique<CheckerClass>()); }
};

} // namespace bridgegrader
