/**
 * @file pdf_validation_engine.h
 * @brief End-to-end PDF validation: structure, signatures, certificates, timestamps
 *
 * Each call builds its own certificate, timestamp and signature components,
 * so one engine can serve concurrent validations.
 */

#pragma once

#include <future>
#include <string>
#include <vector>

#include "collaborators.h"
#include "types.h"

namespace pdftrust::engine {

class PdfValidationEngine {
public:
    explicit PdfValidationEngine(EngineOptions options);

    /**
     * @brief Validate one document
     *
     * Stops after the structure pass only when the header is unreadable.
     *
     * @throws std::invalid_argument if the document is signed and no trusted roots are configured
     */
    PdfValidationResult validatePdf(const std::vector<uint8_t>& bytes) const;

    /// validatePdf on a worker thread; the engine must outlive the future
    std::future<PdfValidationResult> validatePdfAsync(std::vector<uint8_t> bytes) const;

    /**
     * @brief Read a stored document, validate it and hand the JSON result to the sink
     * @param sink Optional; nullptr skips persistence
     */
    PdfValidationResult validateDocument(const std::string& documentId,
                                         IDocumentBytesProvider& provider,
                                         IValidationResultSink* sink = nullptr) const;

    const EngineOptions& options() const { return options_; }

private:
    EngineOptions options_;
};

} // namespace pdftrust::engine
