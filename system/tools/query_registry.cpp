// ============= tools/query_registry.cpp =============
/*
 * Herramienta de consulta para la base SQLite de FaceGate
 *
 * EJEMPLOS DE USO:
 *
 * ./query_registry database/facegate.db --stats
 * ./query_registry database/facegate.db --users
 * ./query_registry database/facegate.db --users --export users.csv
 * ./query_registry database/facegate.db --sessions
 * ./query_registry database/facegate.db --logs 20
 */

#include "core/config.hpp"
#include "core/utils.hpp"
#include "storage/sqlite_storage.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

using namespace facegate;

namespace {

// Comillas dobles si el campo lo necesita
std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) return value;
    std::string out = "\"";
    for (char ch : value) {
        if (ch == '"') out += '"';
        out += ch;
    }
    return out + "\"";
}

}  // namespace

class RegistryQueryTool {
private:
    SqliteStorage storage;

public:
    RegistryQueryTool(const std::string& path)
        : storage(path, static_cast<int64_t>(Config::DEFAULT_TICKET_TTL_SEC) * 1000) {}

    void show_statistics() {
        auto identities = storage.list_identities();
        auto sessions = storage.list_sessions();
        auto logs = storage.recent_logs(1);

        std::cout << "\n═══════════════════════════════════════════════" << std::endl;
        std::cout << "   ESTADÍSTICAS GENERALES" << std::endl;
        std::cout << "═══════════════════════════════════════════════" << std::endl;
        std::cout << "Base de datos:      " << storage.path() << std::endl;
        std::cout << "Identidades:        " << identities.size() << std::endl;
        std::cout << "Sesiones activas:   " << sessions.size() << std::endl;
        if (!identities.empty()) {
            std::cout << "Dim. embedding:     " << identities.front().embedding.size() << std::endl;
            std::cout << "Primer registro:    " << format_timestamp(identities.front().registered_at) << std::endl;
            std::cout << "Último registro:    " << format_timestamp(identities.back().registered_at) << std::endl;
        }
        if (!logs.empty()) {
            std::cout << "Último evento:      " << logs.front().formatted << std::endl;
        }
        std::cout << "═══════════════════════════════════════════════\n" << std::endl;
    }

    void print_users(const std::vector<Identity>& users) {
        if (users.empty()) {
            std::cout << "No hay identidades registradas." << std::endl;
            return;
        }

        std::cout << "\nEncontradas " << users.size() << " identidades:\n" << std::endl;
        std::cout << std::left
                  << std::setw(24) << "Name"
                  << std::setw(10) << "Class"
                  << std::setw(10) << "Roll"
                  << std::setw(14) << "Code"
                  << std::setw(22) << "Registered"
                  << std::endl;
        std::cout << std::string(80, '-') << std::endl;

        for (const auto& u : users) {
            std::cout << std::setw(24) << u.name
                      << std::setw(10) << u.group
                      << std::setw(10) << u.roll
                      << std::setw(14) << u.access_code
                      << std::setw(22) << format_timestamp(u.registered_at)
                      << std::endl;
        }
    }

    std::vector<Identity> users() {
        return storage.list_identities();
    }

    void print_sessions() {
        auto sessions = storage.list_sessions();
        if (sessions.empty()) {
            std::cout << "No hay sesiones activas." << std::endl;
            return;
        }

        std::cout << "\n" << sessions.size() << " sesiones activas:\n" << std::endl;
        std::cout << std::left
                  << std::setw(12) << "Session"
                  << std::setw(24) << "Name"
                  << std::setw(22) << "Start"
                  << std::setw(8) << "Conf"
                  << std::endl;
        std::cout << std::string(66, '-') << std::endl;

        for (const auto& s : sessions) {
            std::cout << std::setw(12) << (s.session_id.substr(0, 8) + "...")
                      << std::setw(24) << s.name
                      << std::setw(22) << format_timestamp(s.started_at)
                      << std::fixed << std::setprecision(2) << s.confidence
                      << std::endl;
        }
    }

    void print_logs(size_t limit) {
        for (const auto& entry : storage.recent_logs(limit)) {
            std::cout << entry.formatted << std::endl;
        }
    }

    void export_csv(const std::vector<Identity>& users, const std::string& filename) {
        std::ofstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("Error abriendo archivo: " + filename);
        }

        file << "name,class,roll,code,registered_at\n";
        for (const auto& u : users) {
            file << csv_field(u.name) << ","
                 << csv_field(u.group) << ","
                 << csv_field(u.roll) << ","
                 << u.access_code << ","
                 << format_iso8601(u.registered_at) << "\n";
        }
        std::cout << "Exportado a: " << filename << std::endl;
    }
};

void print_usage(const char* prog) {
    std::cout << "USO: " << prog << " <facegate.db> [opciones]\n\n";
    std::cout << "OPCIONES:\n";
    std::cout << "  --stats                     Mostrar estadísticas generales\n";
    std::cout << "  --users                     Listar identidades registradas\n";
    std::cout << "  --sessions                  Listar sesiones activas\n";
    std::cout << "  --logs N                    Mostrar los últimos N eventos de auditoría\n";
    std::cout << "  --export FILENAME.csv       Exportar identidades a CSV\n";
    std::cout << "\nEJEMPLOS:\n";
    std::cout << "  " << prog << " database/facegate.db --stats\n";
    std::cout << "  " << prog << " database/facegate.db --users --export users.csv\n";
    std::cout << "  " << prog << " database/facegate.db --logs 20\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    spdlog::set_level(spdlog::level::warn);

    if (!std::filesystem::exists(argv[1])) {
        std::cerr << "Error: no existe " << argv[1] << std::endl;
        return 1;
    }

    try {
        RegistryQueryTool tool(argv[1]);

        bool show_stats = argc == 2;
        bool show_users = false;
        bool show_sessions = false;
        int log_limit = 0;
        std::string export_file;

        for (int i = 2; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--stats") {
                show_stats = true;
            }
            else if (arg == "--users") {
                show_users = true;
            }
            else if (arg == "--sessions") {
                show_sessions = true;
            }
            else if (arg == "--logs" && i + 1 < argc) {
                log_limit = std::stoi(argv[++i]);
            }
            else if (arg == "--export" && i + 1 < argc) {
                export_file = argv[++i];
            }
            else {
                print_usage(argv[0]);
                return 1;
            }
        }

        if (show_stats) tool.show_statistics();

        if (show_users || !export_file.empty()) {
            auto users = tool.users();
            if (show_users) tool.print_users(users);
            if (!export_file.empty()) tool.export_csv(users, export_file);
        }

        if (show_sessions) tool.print_sessions();
        if (log_limit > 0) tool.print_logs(static_cast<size_t>(log_limit));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
