#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include <userver/engine/mutex.hpp>

#include "ai_blend/risk_oracle.hpp"

// Forward declarations for XGBoost
typedef void* BoosterHandle;
typedef void* DMatrixHandle;

namespace wallet_risk {

// Risk oracle backed by a locally loaded XGBoost binary classifier.
// The model outputs a scam probability p; the score is round(p * 100) and the
// confidence is the distance from the decision boundary, round(|p - 0.5| * 200).
class MlRiskOracle : public RiskOracle {
public:
    MlRiskOracle();
    ~MlRiskOracle() override;

    MlRiskOracle(const MlRiskOracle&) = delete;
    MlRiskOracle& operator=(const MlRiskOracle&) = delete;

    // Loads model and feature list by uuid
    // config_dir/<uuid>_json.json (required)
    // config_dir/<uuid>_columns.txt (required)
    bool LoadModelByUuid(const std::string& config_dir, const std::string& uuid);

    bool IsLoaded() const { return xgb_model_ != nullptr; }

    // Throws std::runtime_error when the model is not loaded or prediction fails.
    AiAssessment Assess(const OracleRequest& request) override;

    std::string Name() const override;

    std::vector<float> CreateFeatureVector(const OracleRequest& request) const;

    // Throws std::runtime_error for a non-finite probability.
    static AiAssessment FromProbability(double probability);

private:
    double PredictProbability(const std::vector<float>& features);

    static float SafeFloat(double value);

    BoosterHandle xgb_model_ = nullptr;
    userver::engine::Mutex predict_mutex_;

    std::string model_uuid_;
    std::vector<std::string> feature_names_;
    std::unordered_map<std::string, int> feature_index_map_;
};

}  // namespace wallet_risk
