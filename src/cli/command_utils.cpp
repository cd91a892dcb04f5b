#include <fstream>
#include <iostream>
#include <iterator>

#include <casket/opt/option_builder.hpp>
#include <casket/utils/string.hpp>

#include <mqcert/pki/error.hpp>

#include "command_utils.hpp"

using namespace casket;
using namespace casket::opt;

namespace mqcert::cmd
{

Level ParseLogLevel(std::string_view str)
{
    if (casket::iequals(str, "alert"))
    {
        return Level::Alert;
    }
    else if (casket::iequals(str, "crit"))
    {
        return Level::Critical;
    }
    else if (casket::iequals(str, "error"))
    {
        return Level::Error;
    }
    else if (casket::iequals(str, "warn"))
    {
        return Level::Warning;
    }
    else if (casket::iequals(str, "notice"))
    {
        return Level::Notice;
    }
    else if (casket::iequals(str, "info"))
    {
        return Level::Info;
    }
    else if (casket::iequals(str, "debug"))
    {
        return Level::Debug;
    }

    throw pki::ValidationError(pki::Error::InvalidValue, "unknown log level '" + std::string(str) + "'");
}

bool ParseArgs(CmdLineOptionsParser& parser, const std::vector<std::string_view>& args, std::string_view usage)
{
    try
    {
        parser.parse(args);
        if (parser.isUsed("help"))
        {
            parser.help(std::cout, usage);
            return false;
        }
        parser.validate();
    }
    catch (const pki::ValidationError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw pki::ValidationError(pki::Error::InvalidValue, e.what());
    }
    return true;
}

void AddIdentityOptions(CmdLineOptionsParser& parser, pki::IdentityFields& fields, pki::Role role)
{
    const bool isClient = role == pki::Role::Client;
    const bool isCA = role == pki::Role::CA;

    auto add = [&parser](const std::string& name, std::string* value, const std::string& description, bool required) {
        OptionBuilder builder(name, Value(value));
        builder.setDescription(description);
        if (required)
        {
            builder.setRequired();
        }
        parser.add(builder.build());
    };

    add("cn", &fields.commonName, "Common name", !isCA);
    add("org", &fields.organization, "Organization", isClient);
    add("ou", &fields.organizationalUnit, "Organizational unit", false);
    add("country", &fields.country, "Two-letter country code", isClient);
    add("state", &fields.state, "State or province", isClient);
    add("locality", &fields.locality, "Locality", isClient);
    add("email", &fields.email, "Email address", false);
    add("serial", &fields.serialNumber, "Subject serial number attribute", false);
}

void AddOutputOptions(CmdLineOptionsParser& parser, OutputOptions& options)
{
    // clang-format off
    parser.add(
        OptionBuilder("out", Value(&options.outDir))
            .setDescription("Directory to write the PEM files to (default: print to stdout)")
            .build()
    );
    parser.add(
        OptionBuilder("overwrite")
            .setDescription("Replace existing files in the output directory")
            .build()
    );
    parser.add(
        OptionBuilder("log-level", Value(&options.logLevel))
            .setDescription("Log level [alert|crit|error|warn|notice|info|debug]")
            .setDefaultValue("warn")
            .build()
    );
    // clang-format on
}

void ApplyOutputOptions(CmdLineOptionsParser& parser, OutputOptions& options)
{
    LogManager::Instance().enable(Type::Console);
    LogManager::Instance().setLevel(ParseLogLevel(options.logLevel));

    options.overwrite = parser.isUsed("overwrite");
}

std::string ReadPemFile(const std::string& path)
{
    if (path == "-")
    {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        throw pki::ResourceError(std::make_error_code(std::errc::no_such_file_or_directory),
                                 "cannot read " + path);
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void EmitArtifacts(const OutputOptions& options, const std::vector<pki::Artifact>& artifacts,
                   const std::string& details)
{
    if (options.outDir.empty())
    {
        for (const auto& artifact : artifacts)
        {
            std::cout << artifact.content;
        }
    }
    else
    {
        pki::ArtifactWriter writer(options.outDir, options.overwrite);
        for (const auto& path : writer.write(artifacts))
        {
            std::cout << "Wrote " << path.string() << std::endl;
        }
    }

    std::cout << details;
}

} // namespace mqcert::cmd
