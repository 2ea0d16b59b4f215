#include "mcpcommons/choco/service.hpp"

#include "support/fake_runner.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <string>

using namespace mcpcommons;
using choco::ChocolateyCommandError;
using choco::ChocolateyNotInstalledError;
using choco::ChocolateyService;
using test::FakeRunner;

namespace
{
std::shared_ptr<FakeRunner> installed_runner()
{
    auto runner = std::make_shared<FakeRunner>();
    runner->installed = {"choco", "powershell.exe"};
    return runner;
}

ChocolateyService make_service(std::shared_ptr<FakeRunner> runner)
{
    return ChocolateyService(runner, Logger("choco-test", LogLevel::Error, nullptr));
}

std::string elevated(const std::string& command)
{
    return "Start-Process -FilePath \"choco\" -ArgumentList \"" + command +
           "\" -Verb RunAs -Wait";
}

template <typename E, typename Fn>
std::string error_of(Fn fn)
{
    try
    {
        fn();
    }
    catch (const E& e)
    {
        return e.what();
    }
    return "<no error>";
}
} // namespace

int main()
{
    std::cout << "Test: installed packages..." << std::endl;
    {
        auto runner = installed_runner();
        runner->respond("choco list", 0,
                        "Chocolatey v2.2.2\r\n"
                        "chocolatey 2.2.2\r\n"
                        "git 2.43.0\r\n"
                        "7zip.install 23.1.0\r\n"
                        "3 packages installed.\r\n");
        auto service = make_service(runner);
        auto packages = service.list_installed_packages();
        assert(packages.size() == 3);
        assert(packages[0] == "chocolatey (2.2.2)");
        assert(packages[1] == "git (2.43.0)");
        assert(packages[2] == "7zip.install (23.1.0)");

        runner->respond("choco list", 0, "Chocolatey v2.2.2\nNo packages found.\n");
        assert(service.list_installed_packages().empty());

        runner->respond("choco list", 0, "");
        assert(service.list_installed_packages().empty());
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: sources..." << std::endl;
    {
        auto runner = installed_runner();
        runner->respond("choco source list", 0,
                        "Chocolatey v2.2.2\n"
                        "chocolatey|https://community.chocolatey.org/api/v2/|False|||0|False|False|False\n"
                        " internal | https://nuget.example.com/ |False|ci|5\n"
                        "malformed line\n"
                        "Chocolatey|not|a source\n");
        auto sources = make_service(runner).list_sources();
        assert(sources.size() == 2);
        assert(sources[0] == "chocolatey");
        assert(sources[1] == "internal");
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: search..." << std::endl;
    {
        auto runner = installed_runner();
        runner->respond("choco search --limit-output git", 0, "git|2.43.0\ngit.install|2.43.0\n");
        auto service = make_service(runner);
        auto packages = service.list_available_packages("git");
        assert(packages.size() == 2);
        assert(packages[0] == "git (2.43.0)");
        assert(packages[1] == "git.install (2.43.0)");

        // Empty term searches everything
        service.list_available_packages();
        assert(runner->last_call().args.size() == 2);
        assert(runner->last_call().args[1] == "--limit-output");
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: not installed..." << std::endl;
    {
        auto runner = std::make_shared<FakeRunner>();
        auto service = make_service(runner);
        auto message =
            error_of<ChocolateyNotInstalledError>([&] { service.list_installed_packages(); });
        assert(message == "Chocolatey is not installed or not available in PATH");
        error_of<ChocolateyNotInstalledError>([&] { service.list_sources(); });
        assert(error_of<ChocolateyNotInstalledError>([&] { service.install_package("git"); }) ==
               message);
        assert(runner->calls().empty());
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: failing query..." << std::endl;
    {
        auto runner = installed_runner();
        runner->respond("choco list", 1, "", "access denied");
        auto message = error_of<ChocolateyCommandError>(
            [&] { make_service(runner).list_installed_packages(); });
        assert(message == "Failed to list Chocolatey packages: Failed to run Chocolatey command: "
                          "Command 'choco list' returned non-zero exit status 1.");
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: elevated package commands..." << std::endl;
    {
        auto runner = installed_runner();
        auto service = make_service(runner);

        assert(service.install_package("git", std::string("2.43.0")));
        auto call = runner->last_call();
        assert(call.program == "powershell.exe");
        assert(call.args.size() == 2);
        assert(call.args[0] == "-Command");
        assert(call.args[1] == elevated("install -y git --version=2.43.0"));

        assert(service.upgrade_package("git"));
        assert(runner->last_call().args[1] == elevated("upgrade -y git"));

        assert(service.uninstall_package("git"));
        assert(runner->last_call().args[1] == elevated("uninstall -y git"));

        runner->fallback = cli::CommandResult{1, "", ""};
        assert(!service.install_package("git"));
        assert(!service.uninstall_package("git"));
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: empty names and missing launcher..." << std::endl;
    {
        auto runner = installed_runner();
        auto service = make_service(runner);
        assert(error_of<ChocolateyCommandError>([&] { service.install_package(""); }) ==
               "Package name cannot be empty");
        assert(error_of<ChocolateyCommandError>([&] { service.uninstall_package("  "); }) ==
               "Package name cannot be empty");
        assert(error_of<ChocolateyCommandError>([&] { service.add_source("", "u"); }) ==
               "Source name cannot be empty");
        assert(error_of<ChocolateyCommandError>([&] { service.add_source("n", ""); }) ==
               "Source URL cannot be empty");
        assert(runner->calls().empty());

        runner->unlaunchable = {"powershell.exe"};
        assert(error_of<ChocolateyCommandError>([&] { service.install_package("git"); }) ==
               "Failed to install package git: Failed to run elevated Chocolatey command: "
               "cannot start powershell.exe");
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: sources management..." << std::endl;
    {
        auto runner = installed_runner();
        auto service = make_service(runner);

        assert(service.add_source("internal", "https://nuget.example.com/"));
        assert(runner->last_call().args[1] ==
               elevated("source add -n=internal -s=https://nuget.example.com/"));

        assert(service.add_source("private", "https://p.example.com/", std::string("ci"),
                                  std::string("s3cret"), 5));
        assert(runner->last_call().args[1] ==
               elevated("source add -n=private -s=https://p.example.com/ -u=ci -p=s3cret "
                        "--priority=5"));

        assert(service.remove_source("internal"));
        assert(runner->last_call().args[1] == elevated("source remove -n=internal"));

        // A quote, backtick or '$' in a value stays literal inside the -ArgumentList string
        assert(service.add_source("q\"src", "https://q.example/", std::nullopt,
                                  std::string("pa$$`w")));
        assert(runner->last_call().args[1] ==
               elevated("source add -n=q`\"src -s=https://q.example/ -p=pa`$`$``w"));
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "Test: installing Chocolatey..." << std::endl;
    {
        auto runner = installed_runner();
        assert(make_service(runner).install_chocolatey());
        assert(runner->calls().empty());

        auto fresh = std::make_shared<FakeRunner>();
        auto service = make_service(fresh);
        assert(service.install_chocolatey());
        assert(fresh->calls().size() == 1);
        auto call = fresh->last_call();
        assert(call.program == "powershell.exe");
        assert(call.args[1].find("community.chocolatey.org/install.ps1") != std::string::npos);
        assert(call.args[1].find("-Verb RunAs -Wait") != std::string::npos);

        fresh->fallback = cli::CommandResult{1, "", ""};
        assert(!service.install_chocolatey());

        fresh->unlaunchable = {"powershell.exe"};
        assert(error_of<ChocolateyCommandError>([&] { service.install_chocolatey(); })
                   .rfind("Failed to install Chocolatey: ", 0) == 0);
    }
    std::cout << "  [PASS]" << std::endl;

    std::cout << "\n[OK] chocolatey service tests passed" << std::endl;
    return 0;
}
