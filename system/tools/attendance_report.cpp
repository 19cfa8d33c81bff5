// ============= tools/attendance_report.cpp =============
/*
 * Herramienta de consulta para la base de asistencia
 *
 * EJEMPLOS DE USO:
 *
 * ./build/bin/attendance_report database/attendance.db --stats
 * ./attendance_report attendance.db --recent 10
 * ./attendance_report attendance.db --user U1 --type entry
 * ./attendance_report attendance.db --type exit --export salidas.csv
 */

#include "attendance/sqlite_attendance_store.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace rollcall;

struct ReportFilter {
    std::optional<std::string> user;
    std::optional<EventType> type;
    size_t limit = 100;
};

class AttendanceReport {
private:
    SqliteAttendanceStore& store;
    std::map<std::string, std::string> names;

public:
    explicit AttendanceReport(SqliteAttendanceStore& store) : store(store) {
        for (const auto& identity : store.list_identities()) {
            names[identity.identity_id] = identity.display_name;
        }
    }

    std::string name_of(const std::string& identity_id) const {
        auto it = names.find(identity_id);
        return it != names.end() ? it->second : "(eliminado)";
    }

    void show_statistics() {
        auto events = store.list_events();

        size_t entries = 0, exits = 0;
        double confidence_sum = 0.0;
        std::map<std::string, std::pair<int, int>> per_user;   // entry / exit

        for (const auto& e : events) {
            if (e.event_type == EventType::Entry) {
                entries++;
                per_user[e.identity_id].first++;
            } else {
                exits++;
                per_user[e.identity_id].second++;
            }
            confidence_sum += e.confidence;
        }

        std::cout << "\n═══════════════════════════════════════════════" << std::endl;
        std::cout << "   ESTADÍSTICAS DE ASISTENCIA" << std::endl;
        std::cout << "═══════════════════════════════════════════════" << std::endl;
        std::cout << "Identidades:        " << names.size() << std::endl;
        std::cout << "Total eventos:      " << events.size() << std::endl;
        std::cout << "Entradas / Salidas: " << entries << " / " << exits << std::endl;
        if (!events.empty()) {
            std::cout << "Primer evento:      " << format_timestamp(events.front().occurred_at) << std::endl;
            std::cout << "Último evento:      " << format_timestamp(events.back().occurred_at) << std::endl;
            std::cout << "Confianza promedio: " << std::fixed << std::setprecision(2)
                      << confidence_sum / events.size() << std::endl;
        }
        std::cout << "═══════════════════════════════════════════════\n" << std::endl;

        if (per_user.empty()) return;

        std::cout << "POR PERSONA:" << std::endl;
        for (const auto& [id, counts] : per_user) {
            std::cout << "  " << std::setw(12) << std::left << id
                      << std::setw(20) << name_of(id)
                      << " entradas: " << counts.first
                      << "  salidas: " << counts.second << std::endl;
        }
        std::cout << std::right << std::endl;
    }

    // Más recientes primero
    std::vector<AttendanceEvent> query(const ReportFilter& filter) {
        auto events = store.list_events();

        std::vector<AttendanceEvent> results;
        for (auto it = events.rbegin(); it != events.rend() && results.size() < filter.limit; ++it) {
            if (filter.user && it->identity_id != *filter.user) continue;
            if (filter.type && it->event_type != *filter.type) continue;
            results.push_back(*it);
        }
        return results;
    }

    void print_results(const std::vector<AttendanceEvent>& results) {
        if (results.empty()) {
            std::cout << "No se encontraron resultados." << std::endl;
            return;
        }

        std::cout << "\nEncontrados " << results.size() << " eventos:\n" << std::endl;
        std::cout << std::setw(8) << "ID"
                  << std::setw(14) << "User"
                  << std::setw(20) << "Name"
                  << std::setw(8) << "Type"
                  << std::setw(26) << "Timestamp"
                  << std::setw(8) << "Conf"
                  << std::endl;
        std::cout << std::string(84, '-') << std::endl;

        for (const auto& e : results) {
            std::cout << std::setw(8) << e.event_id
                      << std::setw(14) << e.identity_id
                      << std::setw(20) << name_of(e.identity_id)
                      << std::setw(8) << to_string(e.event_type)
                      << std::setw(26) << format_timestamp(e.occurred_at)
                      << std::setw(8) << std::fixed << std::setprecision(2) << e.confidence
                      << std::endl;
        }
    }

    bool export_csv(const std::vector<AttendanceEvent>& results, const std::string& filename) {
        std::ofstream file(filename);
        if (!file.is_open()) {
            spdlog::error("Error abriendo archivo: {}", filename);
            return false;
        }

        file << "event_id,user_id,name,entry_type,timestamp,confidence\n";
        for (const auto& e : results) {
            file << e.event_id << ","
                 << e.identity_id << ","
                 << "\"" << name_of(e.identity_id) << "\","
                 << to_string(e.event_type) << ","
                 << format_timestamp(e.occurred_at) << ","
                 << std::fixed << std::setprecision(3) << e.confidence << "\n";
        }

        std::cout << "Exportado a: " << filename << std::endl;
        return true;
    }
};

void print_usage(const char* prog) {
    std::cout << "USO: " << prog << " <attendance.db> [opciones]\n\n";
    std::cout << "OPCIONES:\n";
    std::cout << "  --stats                     Mostrar estadísticas generales\n";
    std::cout << "  --recent N                  Mostrar últimos N eventos\n";
    std::cout << "  --user ID                   Filtrar por identidad\n";
    std::cout << "  --type [entry|exit]         Filtrar por tipo de evento\n";
    std::cout << "  --export FILENAME.csv       Exportar resultados a CSV\n";
    std::cout << "\nEJEMPLOS:\n";
    std::cout << "  " << prog << " attendance.db --stats\n";
    std::cout << "  " << prog << " attendance.db --recent 20\n";
    std::cout << "  " << prog << " attendance.db --user U1 --type entry --export u1.csv\n";
}

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] %v");
    spdlog::set_level(spdlog::level::warn);

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        SqliteAttendanceStore store(argv[1]);
        AttendanceReport report(store);

        bool stats_only = false;
        ReportFilter filter;
        std::string export_file;

        for (int i = 2; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--stats") {
                stats_only = true;
            }
            else if (arg == "--recent" && i + 1 < argc) {
                filter.limit = static_cast<size_t>(std::max(0, std::stoi(argv[++i])));
            }
            else if (arg == "--user" && i + 1 < argc) {
                filter.user = argv[++i];
            }
            else if (arg == "--type" && i + 1 < argc) {
                filter.type = parse_event_type(argv[++i]);
            }
            else if (arg == "--export" && i + 1 < argc) {
                export_file = argv[++i];
            }
            else {
                std::cerr << "Opción desconocida: " << arg << "\n\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        if (stats_only) {
            report.show_statistics();
            return 0;
        }

        auto results = report.query(filter);
        report.print_results(results);

        if (!export_file.empty() && !report.export_csv(results, export_file)) {
            return 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
