#pragma once

// warden_cli last-audit
int cmd_last_audit(int argc, char** argv);

// warden_cli verify-audit
int cmd_verify_audit(int argc, char** argv);
