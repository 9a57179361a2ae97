#include "pipeline_engine.hpp"

#include "diagnostic_manager.hpp"
#include "document_parser.hpp"
#include "document_validator.hpp"

#include <chrono>

#include <nlohmann/json.hpp>

namespace layout_sim
{

    namespace
    {

        constexpr const char* kComponent = "PipelineEngine";

        using Clock = std::chrono::steady_clock;

        double elapsedMs(Clock::time_point since)
        {
            return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
        }

        nlohmann::ordered_json issueToJson(const data::Issue& issue)
        {
            nlohmann::ordered_json j;
            j["category"] = data::issueCategoryName(issue.category);
            j["entityKind"] = issue.entityKind;
            j["entityId"] = issue.entityId;
            if (!issue.referenceId.empty())
                j["referenceId"] = issue.referenceId;
            j["message"] = issue.message;
            return j;
        }

        nlohmann::ordered_json issuesToJson(const std::vector<data::Issue>& issues)
        {
            auto arr = nlohmann::ordered_json::array();
            for (const auto& issue : issues)
                arr.push_back(issueToJson(issue));
            return arr;
        }

    } // namespace

    const char* pipelineOutcomeName(PipelineOutcome outcome)
    {
        switch (outcome)
        {
        case PipelineOutcome::Completed: return "completed";
        case PipelineOutcome::ParseFailed: return "parse_failed";
        case PipelineOutcome::ValidationFailed: return "validation_failed";
        case PipelineOutcome::Halted: return "halted";
        }
        return "unknown";
    }

    std::string PipelineReport::toJson() const
    {
        nlohmann::ordered_json j;
        j["outcome"] = pipelineOutcomeName(outcome);
        if (!failureMessage.empty())
            j["failure"] = failureMessage;
        j["document"] = documentId;

        j["statistics"] = {{"objects_created", statistics.objectsCreated},
                           {"connections_created", statistics.connectionsCreated},
                           {"material_units_created", statistics.materialUnitsCreated},
                           {"errors", statistics.errors},
                           {"warnings", statistics.warnings}};

        j["validation"] = {{"is_valid", validation.isValid},
                           {"errors", issuesToJson(validation.errors)},
                           {"warnings", issuesToJson(validation.warnings)}};

        auto mappingArr = nlohmann::ordered_json::array();
        for (const auto& m : mappings)
        {
            nlohmann::ordered_json mj;
            mj["resource"] = m.resourceId;
            mj["template"] = m.templateName;
            mj["name"] = m.objectName;
            mj["errors"] = issuesToJson(m.errors);
            mj["warnings"] = issuesToJson(m.warnings);
            mappingArr.push_back(std::move(mj));
        }
        j["mappings"] = std::move(mappingArr);

        auto muArr = nlohmann::ordered_json::array();
        for (const auto& [productType, name] : materialUnits)
            muArr.push_back({{"product_type", productType}, {"name", name}});
        j["material_units"] = std::move(muArr);

        auto connArr = nlohmann::ordered_json::array();
        for (const auto& [from, to] : createdConnections)
            connArr.push_back({from, to});
        j["connections"] = std::move(connArr);

        j["creation"] = {{"errors", issuesToJson(creationErrors)}, {"warnings", issuesToJson(creationWarnings)}};
        j["post_validation"] = {{"errors", issuesToJson(postValidation.errors)},
                                {"warnings", issuesToJson(postValidation.warnings)}};
        j["timings_ms"] = {{"parse", timings.parseMs},
                           {"validate", timings.validateMs},
                           {"map", timings.mapMs},
                           {"create", timings.createMs},
                           {"total", timings.totalMs}};
        return j.dump(2);
    }

    PipelineEngine::PipelineEngine(config::SchemaConfig schema, config::RuleTable rules,
                                   std::unique_ptr<backend::BackendAdapter> backend, diag::DiagnosticManager* diag)
        : m_schema(std::move(schema)), m_rules(std::move(rules)), m_backend(std::move(backend)), m_diag(diag)
    {
        if (!m_backend)
            throw backend::BackendError("Pipeline requires a backend");
    }

    PipelineReport PipelineEngine::runFile(const std::string& path)
    {
        parser::DocumentParser parser(m_schema, m_diag);
        return runParsed([&]() { return parser.parseFile(path); });
    }

    PipelineReport PipelineEngine::runString(const std::string& xml, const std::string& source)
    {
        parser::DocumentParser parser(m_schema, m_diag);
        return runParsed([&]() { return parser.parseString(xml, source); });
    }

    PipelineReport PipelineEngine::runDocument(const data::Document& doc)
    {
        return runParsed([&]() { return doc; });
    }

    template <typename ParseFn>
    PipelineReport PipelineEngine::runParsed(ParseFn&& parse)
    {
        PipelineReport report;
        const auto     start = Clock::now();

        data::Document doc;
        try
        {
            doc = parse();
        }
        catch (const parser::ParseError& ex)
        {
            report.outcome        = PipelineOutcome::ParseFailed;
            report.failureMessage = ex.what();
        }
        catch (const config::ConfigError& ex)
        {
            report.outcome        = PipelineOutcome::ParseFailed;
            report.failureMessage = ex.what();
        }
        report.timings.parseMs = elapsedMs(start);

        if (report.outcome == PipelineOutcome::ParseFailed)
        {
            if (m_diag)
                m_diag->log(diag::Severity::ERROR, kComponent, "Parse failed: " + report.failureMessage);
            report.timings.totalMs = elapsedMs(start);
            return report;
        }

        report.documentId = doc.identifier;
        runStages(doc, report);
        report.timings.totalMs = elapsedMs(start);

        if (m_diag)
        {
            nlohmann::json extra{{"objects", report.statistics.objectsCreated},
                                 {"connections", report.statistics.connectionsCreated},
                                 {"errors", report.statistics.errors},
                                 {"warnings", report.statistics.warnings},
                                 {"totalMs", report.timings.totalMs}};
            m_diag->log(report.succeeded() ? diag::Severity::INFO : diag::Severity::ERROR, kComponent,
                        std::string("Pipeline ") + pipelineOutcomeName(report.outcome), extra.dump());
        }
        return report;
    }

    void PipelineEngine::runStages(const data::Document& doc, PipelineReport& report)
    {
        auto stageStart   = Clock::now();
        report.validation = data::validateDocument(doc);
        report.timings.validateMs = elapsedMs(stageStart);

        if (m_diag)
        {
            for (const auto& w : report.validation.warnings)
                m_diag->log(diag::Severity::WARN, "Validator", w.message);
            for (const auto& e : report.validation.errors)
                m_diag->log(diag::Severity::ERROR, "Validator", e.message);
        }

        if (!report.validation.isValid)
        {
            report.outcome        = PipelineOutcome::ValidationFailed;
            report.failureMessage = std::to_string(report.validation.errors.size()) + " validation error(s)";
            return;
        }

        stageStart = Clock::now();
        mapping::MappingEngine mapper(m_rules, m_diag);
        report.mappings      = mapper.mapDocument(doc);
        report.materialUnits = mapper.materialUnits();
        report.timings.mapMs = elapsedMs(stageStart);

        stageStart = Clock::now();
        CreationOrchestrator orchestrator(*m_backend, m_rules, m_diag);
        try
        {
            orchestrator.createObjects(report.mappings);
            orchestrator.createConnections(doc);
            report.postValidation = orchestrator.validateCreatedObjects();
        }
        catch (const CreationHalted& ex)
        {
            report.outcome        = PipelineOutcome::Halted;
            report.failureMessage = std::string(errorCategoryName(ex.category())) + ": " + ex.what();
        }
        report.timings.createMs = elapsedMs(stageStart);

        report.createdObjects     = orchestrator.createdObjects();
        report.createdConnections = orchestrator.createdConnections();
        report.statistics         = orchestrator.statistics();
        report.creationErrors     = orchestrator.errors();
        report.creationWarnings   = orchestrator.warnings();

        if (m_diag)
        {
            for (const auto& w : report.postValidation.warnings)
                m_diag->log(diag::Severity::WARN, kComponent, w.message);
        }
    }

    PipelineEngine makePipeline(const std::string& schemaPath, const std::string& rulesPath,
                                const config::PipelineSettings& settings, diag::DiagnosticManager* diag)
    {
        config::ConfigManager mgr;
        auto                  schema = mgr.loadSchemaConfig(schemaPath);
        auto                  rules  = mgr.loadRuleTable(rulesPath);

        if (diag)
            diag->log(diag::Severity::INFO, kComponent,
                      "Loaded " + std::to_string(rules.resourceRules.size()) + " resource rules from " + rulesPath);

        return PipelineEngine(std::move(schema), std::move(rules), backend::createBackend(settings, diag), diag);
    }

} // namespace layout_sim
