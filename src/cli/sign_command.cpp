#include <iostream>
#include <memory>

#include <casket/opt/option_builder.hpp>
#include <casket/opt/cmd_line_options_parser.hpp>

#include <mqcert/cli/command_dispatcher.hpp>
#include <mqcert/pki/extension_profile.hpp>
#include <mqcert/pki/issuance_service.hpp>

#include "command_utils.hpp"

using namespace casket::opt;
using namespace mqcert::pki;

namespace mqcert::sign
{

struct Options
{
    std::string csrPath;
    std::string caKeyPath;
    std::string caCertPath;
    std::string serialDir;
    std::string sans;
    int days{CertSigner::kDefaultValidityDays};
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
        parser_.add(
            OptionBuilder("csr", Value(&options_.csrPath))
                .setDescription("Path to the PEM certificate signing request ('-' for stdin)")
                .setRequired()
                .build()
        );
        parser_.add(
            OptionBuilder("ca-key", Value(&options_.caKeyPath))
                .setDescription("Path to the PEM CA private key")
                .setRequired()
                .build()
        );
        parser_.add(
            OptionBuilder("ca-cert", Value(&options_.caCertPath))
                .setDescription("Path to the PEM CA certificate")
                .setRequired()
                .build()
        );
        parser_.add(
            OptionBuilder("days", Value(&options_.days))
                .setDescription("Validity period in days (default: 365)")
                .build()
        );
        parser_.add(
            OptionBuilder("serial-dir", Value(&options_.serialDir))
                .setDescription("Directory with per-CA serial counters (default: random serials)")
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
        if (!cmd::ParseArgs(parser_, args, role == Role::Broker ? "mqcert sign-broker" : "mqcert sign-client"))
        {
            return;
        }
        cmd::ApplyOutputOptions(parser_, options_.output);

        SignRequest request;
        request.csr = cmd::ReadPemFile(options_.csrPath);
        request.caKey = cmd::ReadPemFile(options_.caKeyPath);
        request.caCert = cmd::ReadPemFile(options_.caCertPath);
        request.validityDays = options_.days;
        request.sans = pki::ParseSanList(options_.sans);

        std::unique_ptr<SerialAllocator> serials;
        if (options_.serialDir.empty())
        {
            serials = std::make_unique<RandomSerialAllocator>();
        }
        else
        {
            serials = std::make_unique<FileSerialAllocator>(options_.serialDir);
        }
        IssuanceService service(*serials);

        auto result = (role == Role::Broker) ? service.signBrokerCert(request) : service.signClientCert(request);
        cmd::EmitArtifacts(options_.output, result.artifacts(), result.certDetails);
    }

private:
    CmdLineOptionsParser parser_;
    Options options_;
};

using ClientCommand = Command<Role::Client>;
using BrokerCommand = Command<Role::Broker>;

REGISTER_COMMAND("sign-client", "Sign a client CSR with the root CA", ClientCommand);
REGISTER_COMMAND("sign-broker", "Sign a broker CSR with the root CA", BrokerCommand);

} // namespace mqcert::sign
