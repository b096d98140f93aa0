#include "serialize/ResultJson.hpp"
#include <cmath>

namespace result_json {

double round2(double v)
{
	return std::round(v * 100.0) / 100.0;
}

const char* toString(CompositionType type)
{
	switch (type) {
		case CompositionType::RuleOfThirds:		return "rule_of_thirds";
		case CompositionType::CenterFraming:	return "center_framing";
		case CompositionType::Symmetry:			return "symmetry";
	}
	return "rule_of_thirds";
}

const char* toString(CompositionStatus status)
{
	switch (status) {
		case CompositionStatus::Perfect:			return "Perfect";
		case CompositionStatus::Good:				return "Good";
		case CompositionStatus::NeedsAdjustment:	return "Needs Adjustment";
	}
	return "Needs Adjustment";
}

const char* toString(SizeClass size)
{
	switch (size) {
		case SizeClass::Small:	return "small";
		case SizeClass::Medium: return "medium";
		case SizeClass::Large:	return "large";
	}
	return "small";
}

const char* toString(Balance balance)
{
	switch (balance) {
		case Balance::Balanced:			return "balanced";
		case Balance::LeftWeighted:		return "left-weighted";
		case Balance::RightWeighted:	return "right-weighted";
	}
	return "balanced";
}

const char* toString(FrameEdge edge)
{
	switch (edge) {
		case FrameEdge::Top:	return "top";
		case FrameEdge::Bottom: return "bottom";
		case FrameEdge::Left:	return "left";
		case FrameEdge::Right:	return "right";
	}
	return "top";
}

const char* toString(SubjectKind kind)
{
	switch (kind) {
		case SubjectKind::None:		return "none";
		case SubjectKind::Face:		return "face";
		case SubjectKind::Human:	return "human";
	}
	return "none";
}

std::optional<CompositionType> compositionTypeFromString(const std::string& s)
{
	if (s == "rule_of_thirds")	return CompositionType::RuleOfThirds;
	if (s == "center_framing")	return CompositionType::CenterFraming;
	if (s == "symmetry")		return CompositionType::Symmetry;
	return std::nullopt;
}

nlohmann::json toJson(const CompositionResult& r, bool detailed)
{
	const CompositionContext& c = r.context;

	nlohmann::json j = {
		{ "composition", toString(r.compositionType) },
		{ "score", round2(r.score) },
		{ "status", toString(r.status) },
		{ "suggestion", r.suggestion },
		{ "context", {
			{ "subjectSize", toString(c.sizeClass) },
			{ "subjectOffsetX", round2(c.offsetX) },
			{ "subjectOffsetY", round2(c.offsetY) },
			{ "multipleSubjects", c.multipleSubjects }
		}}
	};

	if (!detailed) return j;

	nlohmann::json edges = nlohmann::json::array();
	for (FrameEdge e : c.edgeProximity.dangerousEdges) edges.push_back(toString(e));

	auto& ctx = j["context"];
	ctx["areaFraction"] = round2(c.areaFraction);
	ctx["edgeProximity"] = {
		{ "tooClose", c.edgeProximity.tooClose },
		{ "dangerousEdges", edges },
		{ "marginFraction", round2(c.edgeProximity.marginFraction) }
	};
	ctx["headroom"] = {
		{ "ratio", round2(c.headroom.ratio) },
		{ "excessive", c.headroom.excessive },
		{ "cutoff", c.headroom.cutoff },
		{ "optimalForPortrait", c.headroom.optimalForPortrait }
	};
	ctx["reducedConfidence"] = c.reducedConfidence;

	if (r.symmetry) {
		j["symmetry"] = {
			{ "similarity", round2(r.symmetry->similarity) },
			{ "balance", toString(r.symmetry->balance) }
		};
	}
	j["basicOnly"] = r.basicOnly;
	j["frameSeq"] = r.frameSeq;
	return j;
}

std::string toJsonString(const CompositionResult& result, bool detailed, int indent)
{
	return toJson(result, detailed).dump(indent);
}

}	// namespace result_json
