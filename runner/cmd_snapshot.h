#pragma once

// warden_cli snapshots [env]
int cmd_snapshots(int argc, char** argv);

// warden_cli restore <env> <snapshot_name>
int cmd_restore(int argc, char** argv);
