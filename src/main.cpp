#include "address_space.hpp"
#include "cli.hpp"
#include "config_manager.hpp"
#include "diagnostic_manager.hpp"
#include "provision_engine.hpp"
#include "remote_session.hpp"
#include "run_context.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace
{

    std::filesystem::path executableDir(const char* argv0)
    {
        std::error_code ec;
        auto            self = std::filesystem::read_symlink("/proc/self/exe", ec);
        if (!ec)
            return self.parent_path();
        auto fromArgv = std::filesystem::absolute(argv0, ec);
        if (!ec && fromArgv.has_parent_path())
            return fromArgv.parent_path();
        return std::filesystem::current_path();
    }

    int wrapUp(int exitCode)
    {
#if defined(_WIN32)
        std::cout << "Press enter to exit" << std::endl;
        std::string ignored;
        std::getline(std::cin, ignored);
#endif
        return exitCode;
    }

    std::string ask(const std::string& question)
    {
        std::cout << question << std::endl;
        std::string line;
        if (!std::getline(std::cin, line))
            return {};
        return cli::trim(line);
    }

} // namespace

int main(int argc, char* argv[])
{
    cli::ParsedArguments args;
    try
    {
        args = cli::parseArguments(argc, argv);
    }
    catch (const cli::UsageError& ex)
    {
        std::cerr << "Error: " << ex.what() << "\n\n" << cli::usage(argv[0]);
        return 1;
    }

    if (args.showHelp)
    {
        std::cout << cli::usage(argv[0]);
        return 0;
    }
    if (args.showVersion)
    {
        std::cout << cli::kProgramTitle << ' ' << cli::kVersion << std::endl;
        return 0;
    }

    config::ConfigManager cfgMgr(executableDir(argv[0]).string());
    iot_prov::RunContext  ctx;
    try
    {
        ctx.settings = cfgMgr.load(args.overrides);
    }
    catch (const config::ConfigError& ex)
    {
        std::cerr << "Error: " << ex.what() << std::endl;
        return wrapUp(1);
    }

    diag::DiagnosticManager diagMgr(ctx.settings.log);

    auto finish = [&](int exitCode) {
        if (args.exportLogPath && !cli::exportEventLog(diagMgr, *args.exportLogPath, std::cerr) && exitCode == 0)
            exitCode = 1;
        return wrapUp(exitCode);
    };

    for (const auto& line : cfgMgr.describe(ctx.settings))
        std::cout << line << '\n';
    std::cout << std::endl;

    ctx.connector = iot_prov::remote::makeSshConnector(ctx.settings.hostKeyPolicy);
    iot_prov::ProvisionEngine engine(ctx, diagMgr);
    const auto&               folder = ctx.settings.folder;

    if (auto exitCode = cli::runNonInteractive(cfgMgr, ctx.settings, engine, std::cout, std::cerr))
        return finish(*exitCode);

    auto found = cli::findXmlFiles(engine, folder, std::cerr);
    if (!found)
        return finish(1);
    const auto& xmlFiles = *found;

    std::cout << "Found the following XML files in the folder:" << std::endl;
    for (std::size_t i = 0; i < xmlFiles.size(); ++i)
        std::cout << i + 1 << ". " << xmlFiles[i] << std::endl;
    std::cout << std::endl;

    if (!cli::isYes(ask("Do you want to use these files? (y/N)")))
    {
        std::cout << "Aborting." << std::endl;
        return finish(1);
    }

    std::cout << "OPC clients can be active (standard), pulling data every interval, or \n"
                 "passive (subscribers), listening for changes."
              << std::endl;
    auto listenerIndexes =
        cli::parseListenerSelection(ask("Enter the indexes of the files that should be listeners (subscribers), \n"
                                        "separated by commas (e.g., 1,3). If none, just press enter:"),
                                    xmlFiles.size());

    std::string token;
    try
    {
        if (auto fromFile = engine.loadToken(ctx.settings.tokenFolder))
            token = *fromFile;
        else
            token = ask("No 'token.txt' found, enter the InfluxDB token manually:");
    }
    catch (const config::ConfigError& ex)
    {
        std::cerr << ex.what() << std::endl;
        return finish(1);
    }

    std::vector<iot_prov::GroupInput> inputs;
    for (std::size_t i = 0; i < xmlFiles.size(); ++i)
    {
        iot_prov::GroupInput input;
        input.xmlPath = xmlFiles[i];
        input.mode    = std::binary_search(listenerIndexes.begin(), listenerIndexes.end(), i)
                            ? render::InputMode::Subscribe
                            : render::InputMode::Poll;
        input.namespaceNumber = ask("----Enter the namespace number for " + input.xmlPath + ":");
        input.interval        = ask(input.mode == render::InputMode::Subscribe
                                        ? "----Enter the sampling_interval in ms (default 1000ms):"
                                        : "----Enter the interval in ms (default 1000ms):");
        inputs.push_back(std::move(input));
    }

    try
    {
        auto rendered = engine.buildConfiguration(inputs, token);
        engine.writeConfiguration(folder, rendered.content);
    }
    catch (const addrspace::ParseError& ex)
    {
        std::cerr << "Error: " << ex.what() << std::endl;
        return finish(1);
    }
    catch (const std::runtime_error& ex)
    {
        std::cerr << "Error: " << ex.what() << std::endl;
        return finish(1);
    }

    if (cli::isYes(ask("Do you want to send the config file to the IOT box? (y/N)")))
        return finish(cli::sendExisting(engine, folder, std::cout, std::cerr));

    std::cout << "Config file generated. Please copy it and run telegraf manually." << std::endl;
    return finish(0);
}
