#include <Chunking.hpp>
#include <Emitter.hpp>

namespace esmc
{
    std::string toString(const ModuleId &id)
    {
        if (auto str = std::get_if<std::string>(&id))
            return quoteString(*str);
        return std::to_string(std::get<uint32_t>(id));
    }
}
