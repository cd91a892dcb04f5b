#include <iostream>

#include <casket/opt/option_builder.hpp>
#include <casket/opt/cmd_line_options_parser.hpp>

#include <mqcert/cli/command_dispatcher.hpp>
#include <mqcert/pki/artifact_inspector.hpp>

#include "command_utils.hpp"

using namespace casket;
using namespace casket::opt;

namespace mqcert::describe
{

struct Options
{
    std::string input;
    std::string logLevel;
};

class Command final : public cmd::Command
{
public:
    Command()
    {
        // clang-format off
        parser_.add(
            OptionBuilder("help")
                .setDescription("Print help message")
                .build()
        );
        parser_.add(
            OptionBuilder("in", Value(&options_.input))
                .setDescription("Path to a PEM CSR or certificate ('-' for stdin)")
                .setRequired()
                .build()
        );
        parser_.add(
            OptionBuilder("log-level", Value(&options_.logLevel))
                .setDescription("Log level [alert|crit|error|warn|notice|info|debug]")
                .setDefaultValue("warn")
                .build()
        );
        // clang-format on
    }

    ~Command() = default;

    void execute(const std::vector<std::string_view>& args) override
    {
        if (!cmd::ParseArgs(parser_, args, "mqcert describe"))
        {
            return;
        }

        LogManager::Instance().enable(Type::Console);
        LogManager::Instance().setLevel(cmd::ParseLogLevel(options_.logLevel));

        std::cout << pki::ArtifactInspector::describe(cmd::ReadPemFile(options_.input));
    }

private:
    CmdLineOptionsParser parser_;
    Options options_;
};

REGISTER_COMMAND("describe", "Print a PEM CSR or certificate in text form", Command);

} // namespace mqcert::describe
