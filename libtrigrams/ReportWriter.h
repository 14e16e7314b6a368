#pragma once

#include <cstdint>
#include <ostream>

#include "Coordinator.h"

// Abstract class used to present the results of an analysis in a generic
// way. Can be used to print a human readable listing or a JSON document.
class ReportWriter {
   public:
    virtual ~ReportWriter() = default;
    virtual void write(const AnalysisReport &report) = 0;
};

class TextReportWriter : public ReportWriter {
    std::ostream *out;
    uint64_t max_sequences;

    void write_unit(const FileResult &unit);

   public:
    TextReportWriter(std::ostream *out, uint64_t max_sequences)
        : out(out), max_sequences(max_sequences) {}

    virtual void write(const AnalysisReport &report);
};

class JsonReportWriter : public ReportWriter {
    std::ostream *out;
    uint64_t max_sequences;

   public:
    JsonReportWriter(std::ostream *out, uint64_t max_sequences)
        : out(out), max_sequences(max_sequences) {}

    virtual void write(const AnalysisReport &report);
};
