#include <iostream>
#include <memory>
#include <thread>
#include <chrono>
#include <string>
#include <optional>
#include "label_link.h"

using namespace llink;

/**
 * Label Printer Example
 * Discovers label printers on the local network, connects to one and prints a test label
 */
class LabelPrinterExample
{
public:
    struct Options
    {
        std::string configPath;                 // Optional JSON configuration file
        std::string address;                    // Printer address; empty picks the first discovered printer
        PrinterFamily family = PrinterFamily::SMART_PRINTER;
        int discoverySeconds = 8;
        std::optional<int> darkness;
        bool rotate = false;
        std::string label = "^XA^FO50,50^A0N,40,40^FDLabelLink test label^FS^XZ";
    };

    explicit LabelPrinterExample(const Options &options) : options_(options) {}

    int run()
    {
        if (!initialize())
        {
            std::cerr << "\n[FAILED] LabelLink initialization failed!" << std::endl;
            return 1;
        }

        std::string address = options_.address.empty() ? discover() : options_.address;
        if (address.empty())
        {
            std::cerr << "\n[FAILED] No printer found" << std::endl;
            link_.dispose();
            return 1;
        }

        int exitCode = 1;
        if (connect(address))
        {
            configure();
            exitCode = print() ? 0 : 1;
            disconnect();
        }

        link_.dispose();
        std::cout << "\n=== Done ===" << std::endl;
        return exitCode;
    }

private:
    bool initialize()
    {
        std::cout << "\n=== Step 1: Initialize LabelLink ===" << std::endl;

        LabelLink::Config config;
        if (!options_.configPath.empty())
        {
            auto loaded = loadConfigFromFile(options_.configPath);
            if (!loaded.isSuccess())
            {
                std::cerr << "[ERROR] " << loaded.message << std::endl;
                return false;
            }
            config = loaded.value();
        }

        link_.subscribeEvent<DeviceListChangedEvent>([](const std::shared_ptr<DeviceListChangedEvent> &event)
                                                     { std::cout << "  [devices] " << event->devices.size() << " known" << std::endl; });
        link_.subscribeEvent<ConnectionStateEvent>([](const std::shared_ptr<ConnectionStateEvent> &event)
                                                   { std::cout << "  [connection] " << connectionPhaseToString(event->state.phase) << std::endl; });
        link_.subscribeEvent<PrintJobEvent>([](const std::shared_ptr<PrintJobEvent> &event)
                                            { std::cout << "  [job " << event->job.id << "] "
                                                        << printJobStatusToString(event->job.status) << std::endl; });
        link_.subscribeEvent<DiscoveryErrorEvent>([](const std::shared_ptr<DiscoveryErrorEvent> &event)
                                                  { std::cout << "  [discovery] " << event->message << std::endl; });

        auto result = link_.initialize(config);
        if (!result.isSuccess())
        {
            std::cerr << "[ERROR] " << result.message << std::endl;
            return false;
        }
        std::cout << "[SUCCESS] LabelLink initialized" << std::endl;
        return true;
    }

    std::string discover()
    {
        std::cout << "\n=== Step 2: Discover printers ===" << std::endl;
        auto session = link_.startDiscovery();
        if (!session.isSuccess())
        {
            std::cerr << "[ERROR] " << session.message << std::endl;
            return "";
        }

        for (int i = 0; i < options_.discoverySeconds * 2; ++i)
        {
            auto current = link_.getCurrentSession();
            if (current && current->isTerminal())
            {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }

        auto stopped = link_.stopDiscovery();
        if (!stopped.isSuccess())
        {
            std::cerr << "[WARNING] " << stopped.message << std::endl;
        }

        auto devices = link_.getDevices();
        for (const auto &device : devices)
        {
            std::cout << "  " << device.displayName << " (" << device.address << ")"
                      << (device.isWifi ? " [network]" : " [radio]") << std::endl;
        }
        return devices.empty() ? "" : devices.front().address;
    }

    bool connect(const std::string &address)
    {
        std::cout << "\n=== Step 3: Connect to " << address << " ===" << std::endl;
        auto result = link_.connect(address, options_.family);
        if (!result.isSuccess())
        {
            std::cerr << "[ERROR] " << result.message << std::endl;
            return false;
        }
        std::cout << "[SUCCESS] Connected" << std::endl;
        return true;
    }

    void configure()
    {
        if (options_.rotate)
        {
            link_.toggleRotation();
        }
        if (!options_.darkness)
        {
            return;
        }

        std::cout << "\n=== Step 4: Configure darkness " << *options_.darkness << " ===" << std::endl;
        auto result = link_.configure(std::nullopt, options_.darkness);
        if (!result.isSuccess())
        {
            std::cerr << "[WARNING] " << result.message << std::endl;
        }
    }

    bool print()
    {
        std::cout << "\n=== Step 5: Print test label ===" << std::endl;
        auto result = link_.print(options_.label);
        if (!result.isSuccess())
        {
            std::cerr << "[ERROR] " << result.message << std::endl;
            return false;
        }
        std::cout << "[SUCCESS] Job " << result.value().id << " completed" << std::endl;
        return true;
    }

    void disconnect()
    {
        std::cout << "\n=== Step 6: Disconnect ===" << std::endl;
        auto result = link_.disconnect();
        if (!result.isSuccess())
        {
            std::cerr << "[WARNING] " << result.message << std::endl;
        }
    }

    Options options_;
    LabelLink link_;
};

int main(int argc, char *argv[])
{
    try
    {
        LabelPrinterExample::Options options;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            auto next = [&]() -> std::string
            {
                return i + 1 < argc ? argv[++i] : "";
            };

            if (arg == "--address" || arg == "-a")
            {
                options.address = next();
            }
            else if (arg == "--config" || arg == "-c")
            {
                options.configPath = next();
            }
            else if (arg == "--generic" || arg == "-g")
            {
                options.family = PrinterFamily::GENERIC_SOCKET_PRINTER;
            }
            else if (arg == "--darkness" || arg == "-d")
            {
                options.darkness = std::stoi(next());
            }
            else if (arg == "--rotate" || arg == "-r")
            {
                options.rotate = true;
            }
            else if (arg == "--label" || arg == "-l")
            {
                options.label = next();
            }
            else if (arg == "--help" || arg == "-h")
            {
                std::cout << "Usage: " << argv[0] << " [options]" << std::endl;
                std::cout << "\nOptions:" << std::endl;
                std::cout << "  -a, --address ADDR   Printer IP or MAC address (default: first discovered)" << std::endl;
                std::cout << "  -c, --config FILE    JSON configuration file" << std::endl;
                std::cout << "  -g, --generic        Raw socket printer without status channel" << std::endl;
                std::cout << "  -d, --darkness N     Set print darkness before printing" << std::endl;
                std::cout << "  -r, --rotate         Print upside down" << std::endl;
                std::cout << "  -l, --label ZPL      Label to print" << std::endl;
                std::cout << "  -h, --help           Show this help message" << std::endl;
                return 0;
            }
        }

        LabelPrinterExample example(options);
        return example.run();
    }
    catch (const std::exception &e)
    {
        std::cerr << "\n[EXCEPTION] " << e.what() << std::endl;
        return 1;
    }
}
