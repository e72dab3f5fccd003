#include "minitest.hpp"
#include "collectors/SmiDecoder.hpp"
#include "util/Log.hpp"
#include <string>
#include <vector>

using hostscope::collectors::decode_nvidia_smi;
using hostscope::collectors::decode_rocm_smi_csv;
using hostscope::collectors::nvidia_query_arg;
using hostscope::model::GpuReading;

TEST(nvidia_query_arg_lists_columns_in_order) {
  ASSERT_EQ(nvidia_query_arg(),
            "--query-gpu=index,name,utilization.gpu,memory.used,memory.total,power.draw,temperature.gpu");
}

TEST(nvidia_decode_line_with_carriage_return) {
  GpuReading r;
  ASSERT_TRUE(decode_nvidia_smi("0, NVIDIA GeForce RTX 3080, 42, 1024, 10240, 215.50, 65\r\n", r));
  ASSERT_EQ(r.samples.size(), 1u);
  const auto& s = r.samples[0];
  ASSERT_EQ(s.index, 0);
  ASSERT_EQ(s.load, 0.42);
  ASSERT_EQ(s.memory_used_mib, 1024.0);
  ASSERT_EQ(s.memory_total_mib, 10240.0);
  ASSERT_EQ(s.power_w, 215.50);
  ASSERT_EQ(s.temperature_c, 65);
  ASSERT_EQ(r.device_name, "NVIDIA GeForce RTX 3080");
}

TEST(nvidia_decode_bad_memory_field_defaults_to_zero) {
  std::vector<std::string> warnings;
  auto saved = hostscope::util::log_level();
  hostscope::util::set_log_level(hostscope::util::LogLevel::Warn);
  hostscope::util::set_log_sink([&](hostscope::util::LogLevel lvl, const std::string& m) {
    if (lvl == hostscope::util::LogLevel::Warn) warnings.push_back(m);
  });
  GpuReading r;
  bool ok = decode_nvidia_smi("1, Tesla T4, 7, abc, 15360, 27.88, 41\n", r);
  hostscope::util::set_log_sink({});
  hostscope::util::set_log_level(saved);
  ASSERT_TRUE(ok);
  ASSERT_EQ(r.samples.size(), 1u);
  const auto& s = r.samples[0];
  ASSERT_EQ(s.index, 1);
  ASSERT_EQ(s.load, 0.07);
  ASSERT_EQ(s.memory_used_mib, 0.0);
  ASSERT_EQ(s.memory_total_mib, 15360.0);
  ASSERT_EQ(s.power_w, 27.88);
  ASSERT_EQ(s.temperature_c, 41);
  ASSERT_EQ(warnings.size(), 1u);
  ASSERT_TRUE(warnings[0].find("memory-used") != std::string::npos);
}

TEST(nvidia_decode_not_available_power) {
  GpuReading r;
  ASSERT_TRUE(decode_nvidia_smi("0, NVIDIA T400, 3, 100, 2048, [N/A], 38\n", r));
  ASSERT_EQ(r.samples.size(), 1u);
  ASSERT_EQ(r.samples[0].power_w, 0.0);
  ASSERT_EQ(r.samples[0].temperature_c, 38);
}

TEST(nvidia_decode_multiple_cards_and_blank_lines) {
  GpuReading r;
  ASSERT_TRUE(decode_nvidia_smi(
    "0, NVIDIA A100-SXM4-40GB, 100, 39000, 40960, 390.12, 71\n"
    "\n"
    "1, NVIDIA A100-SXM4-40GB, 0, 4, 40960, 55.00, 33\n"
    "\n", r));
  ASSERT_EQ(r.samples.size(), 2u);
  ASSERT_EQ(r.samples[0].load, 1.0);
  ASSERT_EQ(r.samples[1].index, 1);
  ASSERT_EQ(r.samples[1].load, 0.0);
  ASSERT_EQ(r.device_name, "NVIDIA A100-SXM4-40GB");
}

TEST(nvidia_decode_first_name_is_kept) {
  GpuReading r;
  r.device_name = "already known";
  ASSERT_TRUE(decode_nvidia_smi("0, Other, 1, 1, 1, 1, 1\n", r));
  ASSERT_EQ(r.device_name, "already known");
}

TEST(nvidia_decode_short_row_is_skipped) {
  GpuReading r;
  ASSERT_TRUE(decode_nvidia_smi(
    "0, NVIDIA GeForce GTX 1080, 5, 300\n"
    "1, NVIDIA GeForce GTX 1080, 6, 400, 8192, 90.1, 50\n", r));
  ASSERT_EQ(r.samples.size(), 1u);
  ASSERT_EQ(r.samples[0].index, 1);

  GpuReading only_bad;
  ASSERT_TRUE(!decode_nvidia_smi("garbage\n", only_bad));
  ASSERT_TRUE(only_bad.samples.empty());
}

TEST(nvidia_decode_name_containing_separator) {
  GpuReading r;
  ASSERT_TRUE(decode_nvidia_smi("2, Quadro RTX 8000, Rev A, 12, 512, 49152, 60.5, 44\n", r));
  ASSERT_EQ(r.samples.size(), 1u);
  ASSERT_EQ(r.samples[0].index, 2);
  ASSERT_EQ(r.samples[0].load, 0.12);
  ASSERT_EQ(r.samples[0].memory_total_mib, 49152.0);
  ASSERT_EQ(r.samples[0].temperature_c, 44);
  ASSERT_EQ(r.device_name, "Quadro RTX 8000, Rev A");
}

TEST(nvidia_decode_empty_output) {
  GpuReading r;
  ASSERT_TRUE(decode_nvidia_smi("", r));
  ASSERT_TRUE(r.samples.empty());
}

TEST(rocm_decode_csv_table) {
  const char* text =
    "device,Card series,Card model,Card vendor,Card SKU,GPU use (%),"
    "VRAM Total Memory (B),VRAM Total Used Memory (B),Average Graphics Package Power (W),"
    "Temperature (Sensor edge) (C),Temperature (Sensor junction) (C)\n"
    "card0,\"Navi 21 [Radeon RX 6800, XT]\",0x73bf,\"Advanced Micro Devices, Inc. [AMD/ATI]\",D4120100,37,"
    "17163091968,1073741824,112.0,54.6,61.0\n"
    "card1,Vega 10,0x687f,AMD,D05011,0,8573157376,0,9.0,30.2,31.0\n";
  GpuReading r;
  ASSERT_TRUE(decode_rocm_smi_csv(text, r));
  ASSERT_EQ(r.samples.size(), 2u);
  const auto& a = r.samples[0];
  ASSERT_EQ(a.index, 0);
  ASSERT_EQ(a.load, 0.37);
  ASSERT_EQ(a.memory_used_mib, 1024.0);
  ASSERT_EQ(a.memory_total_mib, 16368.0);
  ASSERT_EQ(a.power_w, 112.0);
  ASSERT_EQ(a.temperature_c, 55);
  ASSERT_EQ(r.samples[1].index, 1);
  ASSERT_EQ(r.samples[1].temperature_c, 30);
  ASSERT_EQ(r.device_name, "Navi 21 [Radeon RX 6800, XT]");
}

TEST(rocm_decode_skips_banner_and_requires_header) {
  const char* text =
    "\n"
    "WARNING: unsupported sensor\n"
    "device,GPU use (%),Temperature (Sensor junction) (C)\n"
    "card3,80,70.4\n";
  GpuReading r;
  ASSERT_TRUE(decode_rocm_smi_csv(text, r));
  ASSERT_EQ(r.samples.size(), 1u);
  ASSERT_EQ(r.samples[0].index, 3);
  ASSERT_EQ(r.samples[0].load, 0.8);
  // no edge sensor: falls back to the first temperature column
  ASSERT_EQ(r.samples[0].temperature_c, 70);
  ASSERT_EQ(r.samples[0].memory_total_mib, 0.0);

  GpuReading none;
  ASSERT_TRUE(!decode_rocm_smi_csv("ERROR: no devices\n", none));
}
