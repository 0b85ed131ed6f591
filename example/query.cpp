#include "mdns_scan/display.hpp"
#include "mdns_scan/errors.hpp"
#include "mdns_scan/mdns_discovery.hpp"
#include "mdns_scan/record_store.hpp"
#include "mdns_scan/scan_controller.hpp"
#include "mdns_scan/settings.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

// Scans for a few seconds and prints one line per host
int main(int argc, char** argv)
{
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <query> [seconds]\n";
        return 2;
    }
    const std::string query = argv[1];
    std::chrono::milliseconds duration = std::chrono::seconds(3);
    if (argc > 2) {
        try {
            duration = mdns_scan::ParseSeconds(argv[2], std::chrono::hours(24));
        } catch (const std::invalid_argument& e) {
            std::cerr << e.what() << "\n";
            return 2;
        }
    }

    auto store = std::make_shared<mdns_scan::RecordStore>();
    mdns_scan::ScanController controller(store, std::make_shared<mdns_scan::MdnsDiscoveryBackend>());

    try {
        controller.Start(query);
    } catch (const mdns_scan::SessionOpenError& e) {
        std::cerr << "Cannot scan for " << query << ": " << e.what() << "\n";
        return 1;
    }

    std::this_thread::sleep_for(duration);
    controller.Shutdown();

    const auto rows = mdns_scan::BuildHostRows(store->Snapshot());
    std::cout << "Got " << rows.size() << " hosts.\n";
    for (const auto& row : rows) {
        std::cout << row << "\n";
    }

    return 0;
}
