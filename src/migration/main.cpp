#include "common/app/OnePhaseApplication.h"
#include "migration/service/Server.h"

int main(int argc, char *argv[]) {
  return ostmig::OnePhaseApplication<ostmig::migration::server::MigrationServer>::instance().run(argc, argv);
}
