#include <iostream>

#include <casket/opt/option_builder.hpp>
#include <casket/opt/cmd_line_options_parser.hpp>

#include <mqcert/cli/command_dispatcher.hpp>
#include <mqcert/pki/issuance_service.hpp>

#include "command_utils.hpp"

using namespace casket::opt;
using namespace mqcert::pki;

namespace mqcert::ca
{

struct Options
{
    IdentityFields identity;
    std::string curve;
    int days{CaIssuer::kDefaultValidityDays};
    cmd::OutputOptions output;
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
        cmd::AddIdentityOptions(parser_, options_.identity, Role::CA);
        parser_.add(
            OptionBuilder("curve", Value(&options_.curve))
                .setDescription("Named EC curve")
                .setDefaultValue("prime256v1")
                .build()
        );
        parser_.add(
            OptionBuilder("days", Value(&options_.days))
                .setDescription("Validity period in days (default: 3650)")
                .build()
        );
        // clang-format on
        cmd::AddOutputOptions(parser_, options_.output);
    }

    ~Command() = default;

    void execute(const std::vector<std::string_view>& args) override
    {
        if (!cmd::ParseArgs(parser_, args, "mqcert root-ca"))
        {
            return;
        }
        cmd::ApplyOutputOptions(parser_, options_.output);

        RootCaRequest request;
        request.identity = options_.identity;
        request.curve = options_.curve;
        request.validityDays = options_.days;

        RandomSerialAllocator serials;
        IssuanceService service(serials);

        auto result = service.generateRootCa(request);
        cmd::EmitArtifacts(options_.output, result.artifacts(), result.certDetails);
    }

private:
    CmdLineOptionsParser parser_;
    Options options_;
};

REGISTER_COMMAND("root-ca", "Generate a self-signed root CA key and certificate", Command);

} // namespace mqcert::ca
