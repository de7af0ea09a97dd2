#include "Dialect.hpp"
#include "CommandParsers.hpp"

namespace devwatch::engine
{
    const char *ToString(Dialect dialect)
    {
        switch (dialect)
        {
        case Dialect::A:
            return "A";
        case Dialect::B:
            return "B";
        }
        return "?";
    }

    std::vector<CommandProbe> DefaultHostnameChain()
    {
        return {
            {Dialect::A, "show hostname", parsers::ShowHostname},
            {Dialect::B, "show running-config | include ^hostname", parsers::RunningConfigHostname},
        };
    }

    std::vector<CommandProbe> DefaultModelChain()
    {
        return {
            {Dialect::B, "show version", parsers::ModelNumberField},
            {Dialect::A, "show hardware", parsers::ModelNumberIs},
            {Dialect::A, "show module", parsers::ModuleListing},
        };
    }
}
