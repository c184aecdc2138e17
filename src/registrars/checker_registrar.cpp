#include <bridgegrader/registrars/checker_registrar.hpp>

#include <bridgegrader/checkers/checker.hpp>
#include <bridgegrader/exceptions.hpp>
#include <bridgegrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/find_if.hpp>

#include <memory>
#include <string_view>
#include <utility>
#include <vector>

namespace bridgegrader {

CheckerRegistrar& CheckerRegistrar::get() noexcept {
    // thread-safe singleton initialization pattern
    static CheckerRegistrar local_instance{};

    return local_instance;
}

CheckerRegistrar::CheckerRegistrar() {
    checkers_.push_back(std::make_unique<StandardChecker>());
    checkers_.push_back(std::make_unique<IdenticalChecker>());
}

void CheckerRegistrar::add(std::unique_ptr<Checker> checker) {
    LOG_DEBUG("Registering checker {:?}", checker->get_name());

    checkers_.push_back(std::move(checker));
}

const Checker* CheckerRegistrar::find(std::string_view name) const {
    auto name_matcher = [name](const std::unique_ptr<Checker>& checker) { return checker->get_name() == name; };

    // Search from the back so that later registrations win
    auto iter = ranges::find_if(checkers_.rbegin(), checkers_.rend(), name_matcher);

    if (iter == checkers_.rend()) {
        return nullptr;
    }

    return iter->get();
}

const Checker& CheckerRegistrar::get_checker(std::string_view name) const {
    const Checker* checker = find(name);

    if (checker == nullptr) {
        throw InternalError(fmt::format("unknown checker {:?} (known: {})", name, get_names()), ErrorKind::BadConfig);
    }

    return *checker;
}

std::vector<std::string_view> CheckerRegistrar::get_names() const {
    std::vector<std::string_view> names;
    names.reserve(checkers_.size());

    for (const auto& checker : checkers_) {
        names.push_back(checker->get_name());
    }

    return names;
}

} // namespace bridgegrader
