#include <iostream>

#include <casket/opt/option_builder.hpp>
#include <casket/opt/cmd_line_options_parser.hpp>

#include <mqcert/cli/command_dispatcher.hpp>
#include <mqcert/pki/extension_profile.hpp>
#include <mqcert/pki/issuance_service.hpp>

#include "command_utils.hpp"

using namespace casket::opt;
using namespace mqcert::pki;

namespace mqcert::csr
{

struct Options
{
    IdentityFields identity;
    std::string curve;
    std::string sans;
    cmd::OutputOptions output;
};

template <Role role>
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
        cmd::AddIdentityOptions(parser_, options_.identity, role);
        parser_.add(
            OptionBuilder("curve", Value(&options_.curve))
                .setDescription("Named EC curve")
                .setDefaultValue("prime256v1")
                .build()
        );
        if (role == Role::Broker)
        {
            parser_.add(
                OptionBuilder("san", Value(&options_.sans))
                    .setDescription("Subject alternative names, e.g. DNS:broker.local,IP:10.0.0.5")
                    .build()
            );
        }
        // clang-format on
        cmd::AddOutputOptions(parser_, options_.output);
    }

    ~Command() = default;

    void execute(const std::vector<std::string_view>& args) override
    {
        if (!cmd::ParseArgs(parser_, args, role == Role::Broker ? "mqcert broker-csr" : "mqcert csr"))
        {
            return;
        }
        cmd::ApplyOutputOptions(parser_, options_.output);

        CsrRequest request;
        request.identity = options_.identity;
        request.curve = options_.curve;
        request.sans = pki::ParseSanList(options_.sans);

        RandomSerialAllocator serials;
        IssuanceService service(serials);

        auto result = (role == Role::Broker) ? service.generateBrokerCsr(request) : service.generateClientCsr(request);
        cmd::EmitArtifacts(options_.output, result.artifacts(), result.csrDetails);
    }

private:
    CmdLineOptionsParser parser_;
    Options options_;
};

using ClientCommand = Command<Role::Client>;
using BrokerCommand = Command<Role::Broker>;

REGISTER_COMMAND("csr", "Generate a client key pair and CSR", ClientCommand);
REGISTER_COMMAND("broker-csr", "Generate a broker key pair and CSR", BrokerCommand);

} // namespace mqcert::csr
