#pragma once

#include <bridgegrader/checkers/checker.hpp>

#include <memory>
#include <string_view>
#include <vector>

namespace bridgegrader {

/// A global singleton registrar of secondary checkers, looked up by name.
/// `standard` and `identical` are always present.
class CheckerRegistrar
{
public:
    static CheckerRegistrar& get() noexcept;

    /// Registers a checker under its own name. A checker registered later
    /// shadows an earlier one of the same name.
    void add(std::unique_ptr<Checker> checker);

    /// Throws InternalError for unknown names
    const Checker& get_checker(std::string_view name) const;

    bool contains(std::string_view name) const { return find(name) != nullptr; }

    std::vector<std::string_view> get_names() const;

private:
    CheckerRegistrar();

    const Checker* find(std::string_view name) const;

    std::vector<std::unique_ptr<Checker>> checkers_;
};

} // namespace bridgegrader
