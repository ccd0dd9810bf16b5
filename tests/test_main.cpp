#include <iostream>

int test_json();
int test_log();
int test_file_io();
int test_tasks();
int test_task_codec();
int test_task_machine();
int test_event_log();
int test_zone_detector();
int test_sim_config();
int test_scenario();
int test_simulation();
int test_state_export();
int test_fleet_service();
int test_command_api();

int main() {
  int fails = 0;
  fails += test_json();
  fails += test_log();
  fails += test_file_io();
  fails += test_tasks();
  fails += test_task_codec();
  fails += test_task_machine();
  fails += test_event_log();
  fails += test_zone_detector();
  fails += test_sim_config();
  fails += test_scenario();
  fails += test_simulation();
  fails += test_state_export();
  fails += test_fleet_service();
  fails += test_command_api();

  if (fails == 0) {
    std::cout << "All tests passed\n";
    return 0;
  }
  std::cerr << fails << " tests failed\n";
  return 1;
}
