#include "ReportWriter.h"

#include <algorithm>

#include "Responses.h"
#include "Utils.h"
#include "spdlog/fmt/fmt.h"

void TextReportWriter::write(const AnalysisReport &report) {
    if (!report.invalid_files.empty()) {
        *out << fmt::format(
            "Invalid input: {}\nThis program only accepts {} files.\n",
            join_strings(report.invalid_files, ", "), VALID_FILE_SUFFIX);
    }

    for (const auto &unit : report.units) {
        write_unit(unit);
    }
    out->flush();
}

void TextReportWriter::write_unit(const FileResult &unit) {
    if (unit.sequences.empty()) {
        *out << "\n******************* NO SEQUENCES FOUND "
                "*****************\n\n";
        return;
    }

    *out << fmt::format(
        "\n******************* TOP SEQUENCES: {} *****************\n\n",
        unit.source);

    uint64_t limit = std::min<uint64_t>(max_sequences, unit.sequences.size());
    for (uint64_t i = 0; i < limit; i++) {
        const auto &[sequence, count] = unit.sequences[i];
        *out << fmt::format("{}. {} - {}\n", i + 1, sequence, count);
    }
}

void JsonReportWriter::write(const AnalysisReport &report) {
    *out << Response::report(report, max_sequences).to_string() << std::endl;
}
