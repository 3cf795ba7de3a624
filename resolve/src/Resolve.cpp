#include <Resolve.hpp>
#include <algorithm>

namespace esmc
{
    Request Request::parse(std::string specifier)
    {
        Kind kind = Kind::Unknown;
        if (specifier.starts_with("./") || specifier.starts_with("../") || specifier == "." || specifier == "..")
            kind = Kind::Relative;
        else if (specifier.starts_with('/'))
            kind = Kind::Absolute;
        else if (!specifier.empty())
            kind = Kind::Module;
        return Request{std::move(specifier), kind};
    }

    bool ResolveResult::isUnresolvable() const
    {
        return std::all_of(primary.begin(), primary.end(), [](const auto &entry)
                           { return std::holds_alternative<Item::Unresolvable>(entry.second.data); });
    }

    ResolveResult ResolveResult::module(std::shared_ptr<const esmc::Module> module)
    {
        return ResolveResult{{{"", Item{Item::Module{std::move(module)}}}}};
    }

    ResolveResult ResolveResult::external(std::string request)
    {
        return ResolveResult{{{"", Item{Item::External{std::move(request)}}}}};
    }

    ResolveResult ResolveResult::ignore()
    {
        return ResolveResult{{{"", Item{Item::Ignore{}}}}};
    }

    ResolveResult ResolveResult::unresolvable()
    {
        return ResolveResult{{{"", Item{Item::Unresolvable{}}}}};
    }
}
