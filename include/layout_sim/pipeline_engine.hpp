#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "backend_adapter.hpp"
#include "config_manager.hpp"
#include "creation_orchestrator.hpp"
#include "data_types.hpp"
#include "mapping_engine.hpp"

namespace diag
{
    class DiagnosticManager;
}

namespace layout_sim
{

    enum class PipelineOutcome
    {
        Completed,
        ParseFailed,
        ValidationFailed,
        Halted
    };

    const char* pipelineOutcomeName(PipelineOutcome outcome);

    struct StageTimings
    {
        double parseMs{0.0};
        double validateMs{0.0};
        double mapMs{0.0};
        double createMs{0.0};
        double totalMs{0.0};
    };

    struct PipelineReport
    {
        PipelineOutcome outcome{PipelineOutcome::Completed};
        std::string     failureMessage;

        std::string                                      documentId;
        data::ValidationResult                           validation;
        std::vector<mapping::ObjectMapping>              mappings;
        std::vector<std::pair<std::string, std::string>> materialUnits; // product type -> unit name
        std::vector<CreatedObject>                       createdObjects;
        std::vector<ConnectionPair>                      createdConnections;
        CreationStatistics                               statistics;
        std::vector<data::Issue>                         creationErrors;
        std::vector<data::Issue>                         creationWarnings;
        CreationIssues                                   postValidation;
        StageTimings                                     timings;

        bool succeeded() const { return outcome == PipelineOutcome::Completed; }

        // Summary for reporting layers: outcome, counts, issues and timings.
        std::string toJson() const;
    };

    /**
     * Runs one layout document through parse, validation gate, mapping,
     * object creation, connection creation and post-creation checks,
     * strictly in that order. Each run builds fresh stage state; only the
     * configuration and the backend are shared between runs.
     */
    class PipelineEngine
    {
      public:
        PipelineEngine(config::SchemaConfig schema, config::RuleTable rules,
                       std::unique_ptr<backend::BackendAdapter> backend, diag::DiagnosticManager* diag = nullptr);

        PipelineReport runFile(const std::string& path);
        PipelineReport runString(const std::string& xml, const std::string& source = "<memory>");
        PipelineReport runDocument(const data::Document& doc);

        backend::BackendAdapter& backend() { return *m_backend; }

      private:
        template <typename ParseFn>
        PipelineReport runParsed(ParseFn&& parse);

        void runStages(const data::Document& doc, PipelineReport& report);

        config::SchemaConfig                     m_schema;
        config::RuleTable                        m_rules;
        std::unique_ptr<backend::BackendAdapter> m_backend;
        diag::DiagnosticManager*                 m_diag{nullptr};
    };

    // Loads schema and rule files and wires the backend named in the settings.
    PipelineEngine makePipeline(const std::string& schemaPath, const std::string& rulesPath,
                                const config::PipelineSettings& settings, diag::DiagnosticManager* diag = nullptr);

} // namespace layout_sim
