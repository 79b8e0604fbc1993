#pragma once

// ── HCI 디바이스 (hci0)
#define HUBCAST_HCI_DEVICE              0

// ── LEGO 광고 프로토콜
#define HUBCAST_MANUFACTURER_ID         0x0397      // 919, 명령/상태 프레임 공통
#define HUBCAST_TRAIN_NAME_MARKER       "Train"
#define HUBCAST_SWITCH_NAME_MARKER      "Technic Hub"

// 광고 파라미터 (0.625ms 단위로 변환되어 HCI에 전달)
#define HUBCAST_TRAIN_ADV_INTERVAL_MS   50          // 열차: 빠른 응답
#define HUBCAST_SWITCH_ADV_INTERVAL_MS  100         // 선로전환기: 여유있는 간격
#define HUBCAST_TRAIN_TX_REPEATS        1           // 열차: 짧은 버스트 (배치 처리)
#define HUBCAST_TRAIN_TX_STEP_MS        20
#define HUBCAST_TRAIN_TX_DWELL_MS       20
#define HUBCAST_SWITCH_TX_REPEATS       2           // 페이로드/활성/비활성 사이클 반복 횟수
#define HUBCAST_SWITCH_TX_STEP_MS       100
#define HUBCAST_SWITCH_TX_DWELL_MS      200
#define HUBCAST_TX_KEEP_ADVERTISING     1           // 버스트 후 마지막 명령을 계속 광고

// 스캔
#define HUBCAST_SCAN_SETTLE_MS          1000        // 재시작 전 정리 대기
#define HUBCAST_MONITOR_RESTART_MS      1000        // 스캔 실패 후 재시작 대기
#define HUBCAST_RESET_STEP_MS           500         // 어댑터 power off → on 간격
#define HUBCAST_RESET_ON_STARTUP        0

// ── 생존/활성 판단
#define HUBCAST_LIVENESS_WINDOW_MS      5000
#define HUBCAST_ACTIVE_HOLD_MS          5000        // 명령 후 active 유지 시간
#define HUBCAST_ACTIVE_UPDATE_MS        100
#define HUBCAST_IDLE_UPDATE_MS          500

// ── 명령 파이프라인
#define HUBCAST_QUEUE_CAPACITY          64
#define HUBCAST_TRAIN_BATCH             5
#define HUBCAST_TRAIN_BATCH_GAP_MS      20
#define HUBCAST_SWITCH_GAP_MS           200
#define HUBCAST_MAX_RETRIES             3
#define HUBCAST_RETRY_BASE_MS           500         // attempt i 전 대기 = base * i
#define HUBCAST_VERIFY_TIMEOUT_MS       2000
#define HUBCAST_VERIFY_POLL_MS          100

// ── 로그
#define HUBCAST_LOG_LEVEL               "info"
#define HUBCAST_LOG_FORMAT              "text"
