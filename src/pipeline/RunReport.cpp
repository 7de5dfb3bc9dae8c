#include "conduit/pipeline/RunReport.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace conduit::pipeline {

std::string RunReport::toJson() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();

  w.Key("generated");
  w.StartArray();
  for (auto v : generated) w.Uint(v);
  w.EndArray();

  w.Key("merged");
  w.StartArray();
  for (auto v : merged) w.Uint64(v);
  w.EndArray();

  w.Key("perWorker");
  w.StartArray();
  for (auto n : perWorker) w.Uint64(n);
  w.EndArray();

  w.Key("processedPerWorker");
  w.StartArray();
  for (auto n : processedPerWorker) w.Uint64(n);
  w.EndArray();

  w.Key("generatorSent");  w.Uint64(generatorSent);
  w.Key("mergeForwarded"); w.Uint64(mergeForwarded);

  w.Key("lateStages");
  w.StartArray();
  for (const auto& s : lateStages) w.String(s.c_str(), (rapidjson::SizeType)s.size());
  w.EndArray();

  w.Key("elapsedUs"); w.Int64(elapsed.count());
  w.Key("clean");     w.Bool(clean());

  w.EndObject();
  return std::string(sb.GetString(), sb.GetSize());
}

} // namespace conduit::pipeline
