#include "ml_risk_oracle.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <fstream>
#include <mutex>
#include <stdexcept>

#include <xgboost/c_api.h>

#include <userver/engine/task/cancel.hpp>
#include <userver/logging/log.hpp>

#include "risk_scoring/risk_scorer.hpp"

namespace wallet_risk {

namespace {

std::string Trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

double AgeSeconds(const AddressRecord& record, TimestampMs now) {
    if (record.transaction_count == 0 || now < record.first_seen_time) {
        return 0.0;
    }
    return static_cast<double>(now - record.first_seen_time) / 1000.0;
}

}  // namespace

MlRiskOracle::MlRiskOracle() = default;

MlRiskOracle::~MlRiskOracle() {
    if (xgb_model_) {
        XGBoosterFree(xgb_model_);
    }
}

bool MlRiskOracle::LoadModelByUuid(const std::string& config_dir, const std::string& uuid) {
    model_uuid_ = uuid;
    feature_names_.clear();
    feature_index_map_.clear();
    if (xgb_model_) {
        XGBoosterFree(xgb_model_);
        xgb_model_ = nullptr;
    }

    const std::string columns_path = config_dir + "/" + uuid + "_columns.txt";
    std::ifstream columns_file(columns_path);
    if (!columns_file.is_open()) {
        LOG_ERROR() << "Cannot open feature columns file: " << columns_path;
        return false;
    }
    std::string line;
    int index = 0;
    while (std::getline(columns_file, line)) {
        line = Trim(line);
        if (!line.empty()) {
            feature_names_.push_back(line);
            feature_index_map_[line] = index++;
        }
    }
    if (feature_names_.empty()) {
        LOG_ERROR() << "No features found in " << columns_path;
        return false;
    }
    LOG_INFO() << "Loaded " << feature_names_.size() << " wallet features for model " << uuid;

    const std::string xgb_path = config_dir + "/" + uuid + "_json.json";
    if (!std::ifstream(xgb_path).good()) {
        LOG_ERROR() << "XGBoost model file not found: " << xgb_path;
        return false;
    }
    if (XGBoosterCreate(nullptr, 0, &xgb_model_) != 0) {
        LOG_ERROR() << "XGBoosterCreate failed: " << XGBGetLastError();
        xgb_model_ = nullptr;
        return false;
    }
    if (XGBoosterLoadModel(xgb_model_, xgb_path.c_str()) != 0) {
        LOG_ERROR() << "XGBoosterLoadModel failed for " << xgb_path << ": " << XGBGetLastError();
        XGBoosterFree(xgb_model_);
        xgb_model_ = nullptr;
        return false;
    }
    LOG_INFO() << "Loaded XGBoost risk model from " << xgb_path;
    return true;
}

std::string MlRiskOracle::Name() const {
    return "xgboost:" + model_uuid_;
}

float MlRiskOracle::SafeFloat(double v) {
    if (!std::isfinite(v)) return 0.0f;
    const double max_float = 3.4e37;
    if (v > max_float) return static_cast<float>(max_float);
    if (v < -max_float) return static_cast<float>(-max_float);
    return static_cast<float>(v);
}

std::vector<float> MlRiskOracle::CreateFeatureVector(const OracleRequest& request) const {
    std::vector<float> vec(feature_names_.size(), 0.0f);

    auto set_feature = [&](const std::string& name, double value) {
        auto it = feature_index_map_.find(name);
        if (it != feature_index_map_.end()) {
            vec[it->second] = SafeFloat(value);
        }
    };

    const auto& transfer = request.transfer;
    set_feature("amount", std::log1p(static_cast<double>(transfer.amount)));

    set_feature("sender_transaction_count", static_cast<double>(request.sender.transaction_count));
    set_feature("sender_total_volume", std::log1p(static_cast<double>(request.sender.total_volume)));
    set_feature("sender_rapid_transaction_count", static_cast<double>(request.sender.rapid_transaction_count));
    set_feature("sender_failed_transaction_count", static_cast<double>(request.sender.failed_transaction_count));
    set_feature("sender_contract_ratio", static_cast<double>(ContractInteractionPercentage(request.sender)));
    set_feature("sender_account_age", AgeSeconds(request.sender, transfer.now));

    set_feature("recipient_transaction_count", static_cast<double>(request.recipient.transaction_count));
    set_feature("recipient_total_volume", std::log1p(static_cast<double>(request.recipient.total_volume)));
    set_feature("recipient_account_age", AgeSeconds(request.recipient, transfer.now));

    const std::time_t t = static_cast<std::time_t>(transfer.now / 1000);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    set_feature("hour_of_day", static_cast<double>(tm_utc.tm_hour));
    set_feature("day_of_week", static_cast<double>((tm_utc.tm_wday + 6) % 7));

    const std::string category_feature = "transaction_type_" + std::string(ToString(transfer.category));
    auto it = feature_index_map_.find(category_feature);
    if (it != feature_index_map_.end()) {
        vec[it->second] = 1.0f;
    } else {
        auto it_nan = feature_index_map_.find("transaction_type_nan");
        if (it_nan != feature_index_map_.end()) {
            vec[it_nan->second] = 1.0f;
        }
    }

    return vec;
}

AiAssessment MlRiskOracle::FromProbability(double probability) {
    if (!std::isfinite(probability)) {
        throw std::runtime_error("XGBoost returned a non-finite probability");
    }
    const double p = std::clamp(probability, 0.0, 1.0);
    AiAssessment assessment;
    assessment.score = static_cast<uint8_t>(std::lround(p * 100.0));
    assessment.confidence = static_cast<uint8_t>(std::lround(std::fabs(p - 0.5) * 200.0));
    return assessment;
}

double MlRiskOracle::PredictProbability(const std::vector<float>& features) {
    DMatrixHandle dmat;
    if (XGDMatrixCreateFromMat(features.data(), 1,
                               static_cast<bst_ulong>(features.size()),
                               0.0f, &dmat) != 0) {
        throw std::runtime_error(std::string("XGDMatrixCreateFromMat failed: ") + XGBGetLastError());
    }

    bst_ulong out_len = 0;
    const float* out_result = nullptr;
    float score = 0.0f;
    {
        // The output buffer belongs to the booster and is reused by the next call.
        std::lock_guard<userver::engine::Mutex> lock(predict_mutex_);
        if (userver::engine::current_task::ShouldCancel()) {
            XGDMatrixFree(dmat);
            throw std::runtime_error("XGBoost prediction cancelled while waiting for the booster");
        }
        if (XGBoosterPredict(xgb_model_, dmat, 0, 0, 0, &out_len, &out_result) != 0 || out_len == 0) {
            XGDMatrixFree(dmat);
            throw std::runtime_error(std::string("XGBoosterPredict failed: ") + XGBGetLastError());
        }
        score = out_result[0];
    }
    XGDMatrixFree(dmat);
    return static_cast<double>(score);
}

AiAssessment MlRiskOracle::Assess(const OracleRequest& request) {
    if (!xgb_model_) {
        throw std::runtime_error("XGBoost model not loaded");
    }

    const double probability = PredictProbability(CreateFeatureVector(request));
    const auto assessment = FromProbability(probability);

    LOG_INFO() << "XGBoost scam probability for txn " << request.transfer.transaction_ref
               << ": " << probability << " (score " << static_cast<int>(assessment.score)
               << ", confidence " << static_cast<int>(assessment.confidence) << ")";
    return assessment;
}

}  // namespace wallet_risk
