#include "backup/backup_cli.hpp"
#include "backup/backup_manager.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    try {
        BackupCLI cli(std::make_shared<BackupManager>());
        int exitCode = cli.run(argc, argv);
        Logger::shutdown();
        return exitCode;
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        if (Logger::isInitialized()) {
            Logger::error("Error in main: " + std::string(e.what()));
        }
        return 1;
    }
}
